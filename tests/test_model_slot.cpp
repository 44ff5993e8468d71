#include <catch2/catch_test_macros.hpp>

#include "fake_backend.hpp"

#include <atomic>
#include <chrono>
#include <thread>

TEST_CASE("ModelSlot", "[model_slot]") {
    FakeState state;
    ModelSlot slot(fake_catalog(), fake_factory(state));

    SECTION("LoadsOnFirstAcquire") {
        REQUIRE_FALSE(slot.resident().has_value());
        {
            auto lease = slot.acquire("manual");
            REQUIRE(lease.has_value());
            REQUIRE(lease->spec().id == "manual");
        }
        REQUIRE(state.loads == 1);
        REQUIRE(slot.resident() == "manual");
    }

    SECTION("ReusesResidentModel") {
        REQUIRE(slot.acquire("manual").has_value());
        REQUIRE(slot.acquire("manual").has_value());
        REQUIRE(state.created.size() == 1);
        REQUIRE(state.loads == 1);
    }

    SECTION("SwitchEvictsBeforeLoading") {
        REQUIRE(slot.acquire("manual").has_value());
        REQUIRE(slot.acquire("post").has_value());
        REQUIRE(state.created == std::vector<std::string>{"manual", "post"});
        REQUIRE(state.destroyed == 1);
        REQUIRE(slot.resident() == "post");
    }

    SECTION("UnknownModel") {
        auto lease = slot.acquire("missing");
        REQUIRE_FALSE(lease.has_value());
        REQUIRE(lease.error().kind == ErrorKind::InvalidModel);
        REQUIRE(lease.error().message == "unknown model: missing");
        REQUIRE(state.created.empty());
    }

    SECTION("LoadFailureLeavesSlotEmpty") {
        REQUIRE(slot.acquire("manual").has_value());
        state.fail_load = true;

        auto lease = slot.acquire("native");
        REQUIRE_FALSE(lease.has_value());
        REQUIRE(lease.error().kind == ErrorKind::BackendUnavailable);
        REQUIRE_FALSE(slot.resident().has_value());
        // Both the evicted and the failed backend are gone
        REQUIRE(state.destroyed == 2);

        state.fail_load = false;
        REQUIRE(slot.acquire("native").has_value());
        REQUIRE(slot.resident() == "native");
    }

    SECTION("NullFactoryResult") {
        ModelSlot empty(fake_catalog(), [](const ModelSpec&) { return std::unique_ptr<ModelBackend>(); });
        auto lease = empty.acquire("manual");
        REQUIRE_FALSE(lease.has_value());
        REQUIRE(lease.error().kind == ErrorKind::BackendUnavailable);
    }

    SECTION("Evict") {
        REQUIRE(slot.acquire("manual").has_value());
        slot.evict();
        REQUIRE_FALSE(slot.resident().has_value());
        REQUIRE(state.destroyed == 1);
    }

    SECTION("CatalogLookup") {
        REQUIRE(slot.catalog().size() == 3);
        REQUIRE(slot.find("post") != nullptr);
        REQUIRE(slot.find("post")->category == BackendCategory::ManualPostProcess);
        REQUIRE(slot.find("other") == nullptr);
    }

    SECTION("LeaseIsExclusive") {
        std::atomic<bool> acquired{false};
        std::jthread other;
        {
            auto lease = slot.acquire("manual");
            REQUIRE(lease.has_value());

            other = std::jthread([&] {
                auto second = slot.acquire("native");
                acquired = second.has_value();
            });

            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            REQUIRE_FALSE(acquired.load());
        }
        other.join();
        REQUIRE(acquired.load());
        REQUIRE(slot.resident() == "native");
    }
}
