/**
 * @file test_backend_registry.cc
 * @brief Unit tests for backend_registry using mock adapters
 *
 * Test Coverage:
 * - Registration, replacement and priority ordering
 * - Lazy adapter initialisation and init failures
 * - Live re-enumeration and status handling
 * - Preferred backend fallback
 */

#include <doctest/doctest.h>
#include <rainout/backend_registry.hh>
#include <rainout/enumeration.hh>
#include "../../mock_backends.hh"
#include <algorithm>
#include <memory>

using namespace rainout;
using namespace rainout::test;

TEST_SUITE("BackendRegistry::Unit") {

    TEST_CASE("should_keep_backends_sorted_by_priority") {
        backend_registry registry;
        registry.register_backend(std::make_shared<mock_backend>(backend::jack), 10);
        registry.register_backend(std::make_shared<mock_backend>(backend::alsa), 50);
        registry.register_backend(std::make_shared<mock_backend>(backend::pipewire), 10);

        const auto ids = registry.available_audio_backends();
        REQUIRE(ids.size() == 3);
        CHECK(ids[0] == backend::alsa);
        // equal priorities keep registration order
        CHECK(ids[1] == backend::jack);
        CHECK(ids[2] == backend::pipewire);
    }

    TEST_CASE("should_replace_adapter_with_same_id") {
        backend_registry registry;
        auto first = std::make_shared<mock_backend>(backend::jack);
        auto second = std::make_shared<mock_backend>(backend::jack);
        registry.register_backend(first);
        registry.register_backend(second);

        CHECK(registry.size() == 1);
        CHECK(registry.find(backend::jack) == second);
    }

    TEST_CASE("should_unregister_backends") {
        backend_registry registry;
        registry.register_backend(std::make_shared<mock_backend>(backend::jack));

        CHECK(registry.unregister_backend(backend::jack));
        CHECK_FALSE(registry.unregister_backend(backend::jack));
        CHECK(registry.size() == 0);
        CHECK(registry.find(backend::jack) == nullptr);
    }

    TEST_CASE("should_reject_null_adapter") {
        backend_registry registry;
        CHECK_THROWS(registry.register_backend(nullptr));
        CHECK_THROWS(registry.register_backend(nullptr, 5));
    }

    TEST_CASE("should_initialise_adapters_on_first_use") {
        backend_registry registry;
        auto mock = std::make_shared<mock_backend>();
        registry.register_backend(mock);
        CHECK(mock->init_calls.load() == 0);

        CHECK(registry.find(backend::jack) == mock);
        CHECK(mock->is_initialized());
        CHECK(registry.enumerate_audio_backend(backend::jack).has_value());
        CHECK(mock->init_calls.load() == 1);
    }

    TEST_CASE("should_report_not_installed_when_init_fails") {
        backend_registry registry;
        auto mock = std::make_shared<mock_backend>();
        mock->fail_init = true;
        registry.register_backend(mock);

        const auto opts = registry.enumerate_audio_backend(backend::jack);
        REQUIRE(opts.has_value());
        CHECK(opts->status == backend_status::not_installed);
        CHECK_FALSE(opts->has_devices());
        CHECK(registry.find(backend::jack) == nullptr);
        CHECK_FALSE(registry.find_preferred_audio_backend().has_value());
    }

    TEST_CASE("should_return_nullopt_for_unregistered_backend") {
        backend_registry registry;
        CHECK_FALSE(registry.enumerate_audio_backend(backend::wasapi).has_value());
        CHECK_FALSE(registry.enumerate_midi_backend(backend::wasapi).has_value());
    }

    TEST_CASE("should_enumerate_live_every_time") {
        backend_registry registry;
        auto mock = std::make_shared<mock_backend>();
        registry.register_backend(mock);

        auto before = registry.enumerate_audio_backend(backend::jack);
        REQUIRE(before.has_value());
        CHECK(before->devices.size() == 2);

        // Act: a device disappears between two scans
        mock->audio.devices.pop_back();
        auto after = registry.enumerate_audio_backend(backend::jack);
        REQUIRE(after.has_value());
        CHECK(after->devices.size() == 1);
        // the earlier snapshot is unaffected
        CHECK(before->devices.size() == 2);
    }

    TEST_CASE("should_clear_devices_of_backends_that_are_not_running") {
        backend_registry registry;
        auto mock = std::make_shared<mock_backend>();
        mock->audio.status = backend_status::not_running;
        mock->midi.status = backend_status::not_running;
        registry.register_backend(mock);

        const auto opts = registry.enumerate_audio_backend(backend::jack);
        REQUIRE(opts.has_value());
        CHECK(opts->status == backend_status::not_running);
        CHECK(opts->devices.empty());
        CHECK_FALSE(opts->default_device.has_value());

        const auto midi = registry.enumerate_midi_backend(backend::jack);
        REQUIRE(midi.has_value());
        CHECK(midi->in_ports.empty());
        CHECK_FALSE(midi->default_in_port.has_value());
    }

    TEST_CASE("should_list_only_midi_capable_backends") {
        backend_registry registry;
        auto with_midi = std::make_shared<mock_backend>(backend::jack);
        auto without_midi = std::make_shared<mock_backend>(backend::alsa);
        without_midi->has_midi = false;
        registry.register_backend(with_midi, 10);
        registry.register_backend(without_midi, 20);

        const auto midi = registry.available_midi_backends();
        REQUIRE(midi.size() == 1);
        CHECK(midi[0] == backend::jack);
        CHECK_FALSE(registry.enumerate_midi_backend(backend::alsa).has_value());
    }

    TEST_CASE("should_prefer_running_backend_with_devices") {
        backend_registry registry;
        auto empty = std::make_shared<mock_backend>(backend::jack);
        empty->audio.devices.clear();
        empty->audio.default_device.reset();
        empty->audio.status = backend_status::no_devices;
        auto stopped = std::make_shared<mock_backend>(backend::pipewire);
        stopped->audio.status = backend_status::not_running;
        auto working = std::make_shared<mock_backend>(backend::alsa);
        registry.register_backend(empty, 30);
        registry.register_backend(stopped, 20);
        registry.register_backend(working, 10);

        SUBCASE("with_a_backend_that_has_devices") {
            const auto preferred = registry.find_preferred_audio_backend();
            REQUIRE(preferred.has_value());
            CHECK(preferred->id == backend::alsa);
        }

        SUBCASE("falling_back_to_a_backend_without_devices") {
            registry.unregister_backend(backend::alsa);
            const auto preferred = registry.find_preferred_audio_backend();
            REQUIRE(preferred.has_value());
            CHECK(preferred->id == backend::jack);
            CHECK(preferred->status == backend_status::no_devices);
        }

        SUBCASE("with_nothing_usable") {
            registry.unregister_backend(backend::alsa);
            registry.unregister_backend(backend::jack);
            CHECK_FALSE(registry.find_preferred_audio_backend().has_value());
        }
    }

    TEST_CASE("should_derive_default_priority_from_platform_preference") {
        const auto& order = platform_backend_preference();
        REQUIRE(order.size() >= 2);
        CHECK(order.back() == backend::dummy);
        CHECK(backend_registry::default_priority(order.front()) >
              backend_registry::default_priority(backend::dummy));
        for (std::size_t i = 1; i < order.size(); i++) {
            CHECK(backend_registry::default_priority(order[i - 1]) >
                  backend_registry::default_priority(order[i]));
        }
    }

    TEST_CASE("should_name_backends") {
        CHECK(std::string(to_string(backend::jack)) == "Jack");
        CHECK(backend_from_string("alsa") == backend::alsa);
        CHECK(backend_from_string("WASAPI") == backend::wasapi);
        CHECK_FALSE(backend_from_string("oss").has_value());
        CHECK(backend_kind_of(backend::jack) == backend_kind::duplex_server);
        CHECK(backend_kind_of(backend::wasapi) == backend_kind::split_stream);
    }

    TEST_CASE("global_registry_has_the_null_backend") {
        auto& registry = backend_registry::global();
        CHECK(&registry == &backend_registry::global());
        // seeded once, however often it is reached
        const auto registered = registry.available_audio_backends();
        CHECK(std::count(registered.begin(), registered.end(), backend::dummy) == 1);

        const auto ids = available_audio_backends();
        CHECK(std::find(ids.begin(), ids.end(), backend::dummy) != ids.end());

        const auto opts = enumerate_audio_backend(backend::dummy);
        REQUIRE(opts.has_value());
        CHECK(opts->status == backend_status::running);
        CHECK(opts->has_devices());

        const auto midi = enumerate_midi_backend(backend::dummy);
        REQUIRE(midi.has_value());
        CHECK(midi->in_ports.size() == 1);
    }
}
