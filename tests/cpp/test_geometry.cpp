#include <catch2/catch.hpp>
#include "crossword_csp/geometry.hpp"
#include "crossword_csp/vocabulary.hpp"
#include <stdexcept>
#include <unordered_set>

using namespace crossword_csp;

// ============================================================================
// Slot tests
// ============================================================================

TEST_CASE("Slot identity", "[slot]") {
    Slot a{0, 0, 3, Direction::Across};
    Slot b{0, 0, 3, Direction::Across};
    Slot c{0, 0, 3, Direction::Down};
    Slot d{0, 0, 4, Direction::Across};

    SECTION("equality uses all four fields") {
        REQUIRE(a == b);
        REQUIRE(a != c);
        REQUIRE(a != d);
    }

    SECTION("hashable") {
        std::unordered_set<Slot> set{a, b, c, d};
        REQUIRE(set.size() == 3);
        REQUIRE(set.count(Slot{0, 0, 3, Direction::Down}) == 1);
    }

    SECTION("cells follow the direction") {
        REQUIRE(a.cell(2) == std::pair<size_t, size_t>(0, 2));
        REQUIRE(c.cell(2) == std::pair<size_t, size_t>(2, 0));
    }
}

// ============================================================================
// Geometry derivation tests
// ============================================================================

TEST_CASE("Geometry derives slots from a pattern", "[geometry]") {
    // ___
    // #_#
    // #_#
    auto g = Geometry::from_pattern({"___", "#_#", "#_#"});

    REQUIRE(g.height() == 3);
    REQUIRE(g.width() == 3);
    REQUIRE(g.is_cell(0, 0));
    REQUIRE(!g.is_cell(1, 0));
    REQUIRE(g.num_slots() == 2);

    Slot across{0, 0, 3, Direction::Across};
    Slot down{0, 1, 3, Direction::Down};
    REQUIRE(g.slot(0) == across);
    REQUIRE(g.slot(1) == down);
    REQUIRE(g.index_of(down) == 1);

    SECTION("overlap offsets are ordered by argument") {
        auto o = g.overlap(across, down);
        REQUIRE(o.has_value());
        REQUIRE(o->first == 1);
        REQUIRE(o->second == 0);

        auto r = g.overlap(down, across);
        REQUIRE(r.has_value());
        REQUIRE(r->first == 0);
        REQUIRE(r->second == 1);
    }

    SECTION("neighbors") {
        REQUIRE(g.neighbors(0) == std::vector<size_t>{1});
        REQUIRE(g.neighbors(down) == std::vector<Slot>{across});
        REQUIRE(g.degree(0) == 1);
    }
}

TEST_CASE("Geometry ignores single-cell runs", "[geometry]") {
    // _#_
    // ___
    auto g = Geometry::from_pattern({"_#_", "___"});

    // (1,0) across len 3, (0,0) down len 2, (0,2) down len 2
    REQUIRE(g.num_slots() == 3);
    REQUIRE(g.contains(Slot{0, 0, 2, Direction::Down}));
    REQUIRE(g.contains(Slot{0, 2, 2, Direction::Down}));
    REQUIRE(g.contains(Slot{1, 0, 3, Direction::Across}));
    REQUIRE(!g.contains(Slot{0, 0, 1, Direction::Across}));

    size_t across = g.index_of(Slot{1, 0, 3, Direction::Across});
    REQUIRE(g.degree(across) == 2);

    size_t left = g.index_of(Slot{0, 0, 2, Direction::Down});
    size_t right = g.index_of(Slot{0, 2, 2, Direction::Down});
    REQUIRE(!g.overlap(left, right).has_value());
    REQUIRE(g.overlap(across, right)->first == 2);
    REQUIRE(g.overlap(across, right)->second == 1);
}

TEST_CASE("Geometry from explicit slots", "[geometry]") {
    Geometry g(3, 3, {Slot{0, 0, 3, Direction::Across}, Slot{2, 0, 3, Direction::Across}});

    REQUIRE(g.num_slots() == 2);
    REQUIRE(g.is_cell(2, 1));
    REQUIRE(!g.is_cell(1, 1));
    REQUIRE(!g.overlap(0, 1).has_value());
    REQUIRE(g.neighbors(0).empty());
}

TEST_CASE("Geometry contract violations", "[geometry]") {
    SECTION("ragged rows") {
        std::vector<std::vector<bool>> cells{{true, true}, {true}};
        REQUIRE_THROWS_AS(Geometry(cells), std::invalid_argument);
    }

    SECTION("slot outside the grid") {
        REQUIRE_THROWS_AS(Geometry(2, 2, {Slot{0, 0, 3, Direction::Across}}),
                          std::invalid_argument);
    }

    SECTION("zero-length slot") {
        REQUIRE_THROWS_AS(Geometry(2, 2, {Slot{0, 0, 0, Direction::Across}}),
                          std::invalid_argument);
    }

    SECTION("duplicate slot") {
        Slot s{0, 0, 2, Direction::Across};
        REQUIRE_THROWS_AS(Geometry(2, 2, {s, s}), std::invalid_argument);
    }

    SECTION("slots sharing two cells") {
        REQUIRE_THROWS_AS(Geometry(1, 4, {Slot{0, 0, 3, Direction::Across},
                                          Slot{0, 1, 3, Direction::Across}}),
                          std::invalid_argument);
    }

    SECTION("self overlap and unknown slots") {
        auto g = Geometry::from_pattern({"___"});
        REQUIRE_THROWS_AS(g.overlap(0, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(g.overlap(0, 5), std::out_of_range);
        REQUIRE_THROWS_AS(g.index_of(Slot{1, 1, 2, Direction::Down}), std::out_of_range);
        REQUIRE_THROWS_AS(g.slot(3), std::out_of_range);
    }
}

// ============================================================================
// Vocabulary tests
// ============================================================================

TEST_CASE("Vocabulary sorts and deduplicates", "[vocabulary]") {
    Vocabulary v({"dog", "cat", "dog", "ant"});

    REQUIRE(v.size() == 3);
    REQUIRE(v.word(0) == "ant");
    REQUIRE(v.word(2) == "dog");
    REQUIRE(v.find("cat").value() == 1);
    REQUIRE(!v.find("cow").has_value());
    REQUIRE_THROWS_AS(v.word(3), std::out_of_range);
}
