// Nearest Fingerprint Finder Validation Test
//
// Purpose: Validate k-nearest search over located fingerprints
//
// Tests:
// 1. Ranking by raw distance, ascending
// 2. Fingerprints without common sources excluded
// 3. Single qualifying fingerprint returned by find_nearest_to
// 4. Stable ordering of ties
// 5. Mean-removed mode finds the biased match
// 6. Invalid arguments
// 7. Collection must outlive the finder (no temporaries)
//
// Expected Results:
// - Neighbours sorted by distance, truncated to qualifying candidates

#include "finder/nearest_fingerprint_finder.hpp"
#include "core/errors.hpp"
#include "test_harness.hpp"

#include <type_traits>

using namespace rfloc;

namespace {

LocatedFingerprint2d located(double a, double b, double c, double x, double y) {
    std::vector<RssiReading> readings;
    readings.emplace_back("ap-a", a);
    readings.emplace_back("ap-b", b);
    readings.emplace_back("ap-c", c);
    return LocatedFingerprint2d(readings, Point2d(x, y));
}

RssiFingerprint query(double a, double b, double c) {
    RssiFingerprint fp;
    fp.add_reading(RssiReading("ap-a", a));
    fp.add_reading(RssiReading("ap-b", b));
    fp.add_reading(RssiReading("ap-c", c));
    return fp;
}

}  // namespace

// ========== Test 1: Ranking ==========

bool test_raw_ranking() {
    TEST("Ranking by raw distance, ascending");

    std::vector<LocatedFingerprint2d> db;
    db.push_back(located(-70.0, -70.0, -70.0, 0.0, 0.0));   // distance 17.3
    db.push_back(located(-60.0, -60.0, -62.0, 1.0, 0.0));   // distance 2
    db.push_back(located(-65.0, -60.0, -60.0, 2.0, 0.0));   // distance 5

    NearestFingerprintFinder2d finder(db, FinderMode::RAW);
    auto neighbours = finder.find_k_nearest_to(query(-60.0, -60.0, -60.0), 2);

    EXPECT_TRUE(neighbours.size() == 2);
    EXPECT_TRUE(neighbours[0].index == 1);
    EXPECT_TRUE(neighbours[1].index == 2);
    EXPECT_NEAR(neighbours[0].distance, 2.0, 1e-12);
    EXPECT_NEAR(neighbours[1].distance, 5.0, 1e-12);
    EXPECT_TRUE(neighbours[0].fingerprint == &db[1]);

    // k larger than the collection
    auto all = finder.find_k_nearest_to(query(-60.0, -60.0, -60.0), 10);
    EXPECT_TRUE(all.size() == 3);
    EXPECT_TRUE(all[2].index == 0);

    TEST_PASS();
}

// ========== Test 2: No Common Sources ==========

bool test_excludes_disjoint() {
    TEST("Fingerprints without common sources excluded");

    std::vector<RssiReading> other;
    other.emplace_back("ap-x", -50.0);
    other.emplace_back("ap-y", -55.0);

    std::vector<LocatedFingerprint2d> db;
    db.emplace_back(other, Point2d(5.0, 5.0));
    db.push_back(located(-61.0, -60.0, -60.0, 1.0, 1.0));

    NearestFingerprintFinder2d finder(db, FinderMode::RAW);
    auto neighbours = finder.find_k_nearest_to(query(-60.0, -60.0, -60.0), 2);
    EXPECT_TRUE(neighbours.size() == 1);
    EXPECT_TRUE(neighbours[0].index == 1);

    // No candidate qualifies at all
    std::vector<LocatedFingerprint2d> disjoint;
    disjoint.emplace_back(other, Point2d(5.0, 5.0));
    NearestFingerprintFinder2d empty_finder(disjoint, FinderMode::MEAN_REMOVED);
    EXPECT_TRUE(empty_finder.find_k_nearest_to(query(-60.0, -60.0, -60.0), 3).empty());
    EXPECT_TRUE(!empty_finder.find_nearest_to(query(-60.0, -60.0, -60.0)).has_value());

    TEST_PASS();
}

// ========== Test 3: Single Qualifying Fingerprint ==========

bool test_single_qualifying() {
    TEST("Single qualifying fingerprint returned by find_nearest_to");

    std::vector<RssiReading> far_readings;
    far_readings.emplace_back("ap-q", -40.0);

    std::vector<RssiReading> sharing;
    sharing.emplace_back("ap-c", -90.0);
    sharing.emplace_back("ap-z", -40.0);

    std::vector<LocatedFingerprint2d> db;
    db.emplace_back(far_readings, Point2d(0.0, 0.0));
    db.emplace_back(sharing, Point2d(7.0, -3.0));
    db.emplace_back(far_readings, Point2d(1.0, 0.0));

    for (FinderMode mode : {FinderMode::RAW, FinderMode::MEAN_REMOVED}) {
        NearestFingerprintFinder2d finder(db, mode);
        auto nearest = finder.find_nearest_to(query(-60.0, -60.0, -60.0));
        EXPECT_TRUE(nearest.has_value());
        EXPECT_TRUE(nearest->index == 1);
        EXPECT_NEAR(nearest->fingerprint->position().x(), 7.0, 1e-12);
    }

    TEST_PASS();
}

// ========== Test 4: Ties ==========

bool test_stable_ties() {
    TEST("Stable ordering of ties");

    std::vector<LocatedFingerprint2d> db;
    db.push_back(located(-62.0, -60.0, -60.0, 0.0, 0.0));
    db.push_back(located(-60.0, -62.0, -60.0, 1.0, 0.0));
    db.push_back(located(-60.0, -60.0, -62.0, 2.0, 0.0));

    NearestFingerprintFinder2d finder(db, FinderMode::RAW);
    auto neighbours = finder.find_k_nearest_to(query(-60.0, -60.0, -60.0), 3);

    EXPECT_TRUE(neighbours.size() == 3);
    EXPECT_TRUE(neighbours[0].index == 0);
    EXPECT_TRUE(neighbours[1].index == 1);
    EXPECT_TRUE(neighbours[2].index == 2);

    TEST_PASS();
}

// ========== Test 5: Mean-Removed Mode ==========

bool test_mean_removed_mode() {
    TEST("Mean-removed mode finds the biased match");

    // Index 0 has the query's shape shifted by -8 dB; index 1 is closer in raw terms
    std::vector<LocatedFingerprint2d> db;
    db.push_back(located(-68.0, -73.0, -83.0, 0.0, 0.0));
    db.push_back(located(-63.0, -63.0, -72.0, 5.0, 5.0));

    RssiFingerprint q = query(-60.0, -65.0, -75.0);

    NearestFingerprintFinder2d raw(db, FinderMode::RAW);
    NearestFingerprintFinder2d no_mean(db, FinderMode::MEAN_REMOVED);

    EXPECT_TRUE(raw.find_nearest_to(q)->index == 1);
    EXPECT_TRUE(no_mean.find_nearest_to(q)->index == 0);
    EXPECT_NEAR(no_mean.find_nearest_to(q)->distance, 0.0, 1e-9);

    auto raw_d = NearestFingerprintFinder2d::distance(q, db[0], FinderMode::RAW);
    EXPECT_TRUE(raw_d.has_value());
    EXPECT_NEAR(*raw_d, std::sqrt(3.0 * 64.0), 1e-9);

    TEST_PASS();
}

// ========== Test 6: Invalid Arguments ==========

bool test_invalid_arguments() {
    TEST("Invalid arguments");

    std::vector<LocatedFingerprint2d> empty;
    EXPECT_THROW((void)NearestFingerprintFinder2d(empty, FinderMode::RAW), ConfigurationError);

    std::vector<LocatedFingerprint2d> db;
    db.push_back(located(-60.0, -60.0, -60.0, 0.0, 0.0));
    NearestFingerprintFinder2d finder(db, FinderMode::RAW);
    EXPECT_THROW(finder.find_k_nearest_to(query(-60.0, -60.0, -60.0), 0), ConfigurationError);

    TEST_PASS();
}

// ========== Test 7: Lifetime ==========

bool test_rejects_temporary_collection() {
    TEST("Collection must outlive the finder (no temporaries)");

    using Collection = std::vector<LocatedFingerprint2d>;
    static_assert(std::is_constructible_v<NearestFingerprintFinder2d, const Collection&, FinderMode>);
    static_assert(std::is_constructible_v<NearestFingerprintFinder2d, Collection&, FinderMode>);
    static_assert(!std::is_constructible_v<NearestFingerprintFinder2d, Collection&&, FinderMode>);
    static_assert(!std::is_constructible_v<NearestFingerprintFinder2d, Collection, FinderMode>);

    // The finder reads the caller's collection, not a copy
    std::vector<LocatedFingerprint2d> db;
    db.push_back(located(-60.0, -60.0, -60.0, 0.0, 0.0));
    NearestFingerprintFinder2d finder(db, FinderMode::RAW);
    EXPECT_TRUE(&finder.fingerprints() == &db);
    EXPECT_TRUE(finder.find_nearest_to(query(-61.0, -60.0, -60.0))->fingerprint == &db[0]);

    TEST_PASS();
}

int main() {
    std::cout << "\n============================================" << std::endl;
    std::cout << "  Nearest Fingerprint Finder Validation Test" << std::endl;
    std::cout << "============================================\n" << std::endl;

    test_raw_ranking();
    test_excludes_disjoint();
    test_single_qualifying();
    test_stable_ties();
    test_mean_removed_mode();
    test_invalid_arguments();
    test_rejects_temporary_collection();

    return print_summary("Nearest Fingerprint Finder");
}
