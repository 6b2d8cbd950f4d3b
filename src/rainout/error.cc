#include <rainout/error.hh>
#include <ostream>

namespace rainout {

const char* to_string(run_config_errc code) {
    switch (code) {
        case run_config_errc::backend_unavailable: return "backend unavailable";
        case run_config_errc::device_not_found: return "device not found";
        case run_config_errc::port_not_found: return "port not found";
        case run_config_errc::invalid_sample_rate: return "invalid sample rate";
        case run_config_errc::invalid_block_size: return "invalid block size";
        case run_config_errc::no_suitable_device: return "no suitable device";
        case run_config_errc::timeout: return "timeout";
        case run_config_errc::device_open_failed: return "device open failed";
    }
    return "unknown error";
}

std::ostream& operator<<(std::ostream& os, run_config_errc code) {
    return os << to_string(code);
}

run_config_error::run_config_error(run_config_errc code, const std::string& detail)
    : rainout_error(std::string(to_string(code)) + ": " + detail),
      m_code(code) {
}

const char* to_string(change_config_errc code) {
    switch (code) {
        case change_config_errc::not_supported: return "not supported by backend";
        case change_config_errc::busy: return "reconfiguration queue is full";
    }
    return "unknown error";
}

change_config_error::change_config_error(change_config_errc code, const std::string& detail)
    : rainout_error(std::string(to_string(code)) + ": " + detail),
      m_code(code) {
}

} // namespace rainout
