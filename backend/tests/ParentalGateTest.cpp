#include "TestSupport.hpp"

#include "engine/ParentalGate.hpp"
#include "engine/PersistenceManager.hpp"

#include <chrono>
#include <memory>

#include <doctest/doctest.h>

namespace
{
using namespace kc::tests;
using kc::engine::GateDecision;

struct GateFixture
{
    explicit GateFixture(std::string_view tag)
        : dir(tag), clock(std::make_shared<ManualClock>()),
          persistence(dir.path() / "state.db")
    {
        persistence.set_active_user("user-1");
    }

    std::unique_ptr<kc::engine::ParentalGate> make_gate(int max_attempts = 5,
                                                        int lockout_minutes = 5)
    {
        auto gate = std::make_unique<kc::engine::ParentalGate>(
            std::make_shared<FixedPinVerifier>("4321"), &persistence, clock,
            max_attempts, lockout_minutes);
        gate->load();
        return gate;
    }

    TempDir dir;
    std::shared_ptr<ManualClock> clock;
    kc::engine::PersistenceManager persistence;
};

} // namespace

TEST_CASE("The right PIN is granted and resets the failure count")
{
    GateFixture fx("gate-granted");
    auto gate = fx.make_gate();

    CHECK(gate->authorize("0000") == GateDecision::WrongPin);
    CHECK(gate->authorize("1111") == GateDecision::WrongPin);
    CHECK(gate->failed_attempts() == 2);

    CHECK(gate->authorize("4321") == GateDecision::Granted);
    CHECK(gate->failed_attempts() == 0);
}

TEST_CASE("Five wrong PINs lock the gate even against the right one")
{
    GateFixture fx("gate-lockout");
    auto gate = fx.make_gate();

    for (int i = 0; i < 4; ++i)
    {
        CHECK(gate->authorize("0000") == GateDecision::WrongPin);
    }
    CHECK(gate->authorize("0000") == GateDecision::LockedOut);
    CHECK(gate->is_locked());
    CHECK(gate->authorize("4321") == GateDecision::LockedOut);

    fx.clock->advance(std::chrono::minutes(4));
    CHECK(gate->authorize("4321") == GateDecision::LockedOut);
}

TEST_CASE("The lockout expires and the counter starts over")
{
    GateFixture fx("gate-expiry");
    auto gate = fx.make_gate();
    for (int i = 0; i < 5; ++i)
    {
        gate->authorize("0000");
    }
    REQUIRE(gate->is_locked());

    fx.clock->advance(std::chrono::minutes(5));
    CHECK_FALSE(gate->is_locked());
    CHECK(gate->failed_attempts() == 0);
    CHECK(gate->authorize("0000") == GateDecision::WrongPin);
    CHECK(gate->failed_attempts() == 1);
    CHECK(gate->authorize("4321") == GateDecision::Granted);
}

TEST_CASE("Failed attempts and lockouts survive a restart")
{
    GateFixture fx("gate-restart");
    {
        auto gate = fx.make_gate();
        gate->authorize("0000");
        gate->authorize("0000");
        gate->authorize("0000");
    }
    {
        auto gate = fx.make_gate();
        CHECK(gate->failed_attempts() == 3);
        gate->authorize("0000");
        CHECK(gate->authorize("0000") == GateDecision::LockedOut);
    }
    auto gate = fx.make_gate();
    CHECK(gate->is_locked());
    CHECK(gate->authorize("4321") == GateDecision::LockedOut);
}

TEST_CASE("A custom attempt limit is honoured")
{
    GateFixture fx("gate-custom");
    auto gate = fx.make_gate(2, 1);
    CHECK(gate->authorize("0000") == GateDecision::WrongPin);
    CHECK(gate->authorize("0000") == GateDecision::LockedOut);
    fx.clock->advance(std::chrono::minutes(1));
    CHECK(gate->authorize("4321") == GateDecision::Granted);
}

TEST_CASE("Without a verifier every PIN is refused")
{
    GateFixture fx("gate-no-verifier");
    kc::engine::ParentalGate gate(nullptr, &fx.persistence, fx.clock, 5, 5);
    gate.load();
    CHECK(gate.authorize("4321") == GateDecision::WrongPin);
    CHECK(gate.failed_attempts() == 0);
}
