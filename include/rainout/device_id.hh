#ifndef RAINOUT_DEVICE_ID_HH
#define RAINOUT_DEVICE_ID_HH

#include <rainout/export_rainout.h>
#include <iosfwd>
#include <optional>
#include <utility>
#include <string>

namespace rainout {

/**
 * @struct device_id
 * @brief Identifies a device across enumeration calls
 *
 * Names are for humans and may not be unique; the identifier, when the
 * backend supplies one, is stable and unique.
 */
struct device_id {
    std::string name;
    std::optional<std::string> identifier;

    device_id() = default;

    explicit device_id(std::string name_, std::optional<std::string> identifier_ = std::nullopt)
        : name(std::move(name_)), identifier(std::move(identifier_)) {
    }

    /**
     * @brief Identity test used by the resolver and the device monitor
     *
     * Compares identifiers when both sides carry one, otherwise names.
     */
    [[nodiscard]] bool matches(const device_id& other) const {
        if (identifier && other.identifier) {
            return *identifier == *other.identifier;
        }
        return name == other.name;
    }

    bool operator==(const device_id& other) const {
        return name == other.name && identifier == other.identifier;
    }

    bool operator!=(const device_id& other) const {
        return !(*this == other);
    }
};

RAINOUT_EXPORT std::ostream& operator<<(std::ostream& os, const device_id& id);

} // namespace rainout

#endif // RAINOUT_DEVICE_ID_HH
