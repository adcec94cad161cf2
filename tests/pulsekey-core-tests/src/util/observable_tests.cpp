#include <catch2/catch_test_macros.hpp>

#include <pulsekey/util/observable.hpp>

#include <vector>

using namespace pulsekey;

namespace observable {

TEST_CASE("Observables notify their observers on assignment", "[util][observable]") {
    util::Observable<bool> value{false};
    std::vector<bool> seen{};

    SECTION("plain observers wait for the next assignment") {
        value.Observe([&](bool v) { seen.push_back(v); });
        CHECK(seen.empty());

        value = true;
        value = true;
        CHECK(seen == std::vector{true, true});
    }

    SECTION("notifying observers see the current value immediately") {
        value = true;
        value.ObserveAndNotify([&](bool v) { seen.push_back(v); });
        CHECK(seen == std::vector{true});

        value = false;
        CHECK(seen == std::vector{true, false});
    }

    SECTION("removed observers are not called") {
        const auto id = value.ObserveAndNotify([&](bool v) { seen.push_back(v); });
        std::vector<bool> others{};
        value.Observe([&](bool v) { others.push_back(v); });

        value.Unobserve(id);
        value = true;

        CHECK(seen == std::vector{false});
        CHECK(others == std::vector{true});
        CHECK(value.Get());
    }
}

} // namespace observable
