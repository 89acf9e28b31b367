#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/tombstone.hpp"

using namespace tagsync;

namespace {

rc::Gen<TombstoneKey> key_gen() {
    return rc::gen::apply(
        [](bool is_page, std::string id) {
            return TombstoneKey{is_page ? EntityKind::Page : EntityKind::Tag, std::move(id)};
        },
        rc::gen::arbitrary<bool>(),
        rc::gen::nonEmpty(rc::gen::oneOf(
            rc::gen::element<std::string>("work", "p_1a2b", "c_____rust", "tag_5a2m5Lmg", "a:b"),
            rc::gen::container<std::string>(rc::gen::inRange('0', 'z')))));
}

} // namespace

TEST_CASE("Property: the persisted form restores the ledger", "[property][tombstone]") {
    REQUIRE(rc::check("from_strings(to_strings(l)) == l", [] {
        const auto keys = *rc::gen::container<std::vector<TombstoneKey>>(key_gen());
        TombstoneLedger ledger;
        for (const auto& key : keys) {
            ledger.record_deletion(key.kind, key.id);
        }

        std::vector<std::string> rejected;
        const auto restored = TombstoneLedger::from_strings(ledger.to_strings(), &rejected);

        RC_ASSERT(rejected.empty());
        RC_ASSERT(restored == ledger);
    }));
}

TEST_CASE("Property: a cleared marker is no longer pending", "[property][tombstone]") {
    REQUIRE(rc::check("record then clear", [] {
        const auto keys = *rc::gen::nonEmpty(rc::gen::container<std::vector<TombstoneKey>>(key_gen()));
        const auto victim = *rc::gen::elementOf(keys);
        TombstoneLedger ledger;
        for (const auto& key : keys) {
            ledger.record_deletion(key.kind, key.id);
        }
        const auto before = ledger.size();

        RC_ASSERT(ledger.is_pending(victim.kind, victim.id));
        RC_ASSERT(!ledger.record_deletion(victim.kind, victim.id));
        RC_ASSERT(ledger.clear_deletion(victim.kind, victim.id));
        RC_ASSERT(!ledger.is_pending(victim.kind, victim.id));
        RC_ASSERT(ledger.size() == before - 1);
        RC_ASSERT(!ledger.clear_deletion(victim.kind, victim.id));
    }));
}
