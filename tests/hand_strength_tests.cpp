#include <catch2/catch.hpp>
#include "eval/hand_strength.hpp"
#include "core/cards.hpp"

#include <stdexcept>
#include <vector>

using namespace poker_table;

TEST_CASE("Draw detection", "[strength][draws]") {
    SECTION("Flush draw") {
        auto d = analyze_draws(cards_from_string("Ah Kh"), cards_from_string("Qh 7h 2c"));
        REQUIRE(d.is_flush_draw);
        REQUIRE(d.flush_outs == 9);
        REQUIRE_FALSE(d.is_straight_draw);
        REQUIRE(d.total_outs == 9);
    }

    SECTION("Open-ended straight draw") {
        auto d = analyze_draws(cards_from_string("8c 9d"), cards_from_string("Ts Jh 2c"));
        REQUIRE(d.is_open_ended);
        REQUIRE_FALSE(d.is_gutshot);
        REQUIRE(d.straight_outs == 8);
        REQUIRE(d.total_outs == 8);
    }

    SECTION("Gutshot") {
        auto d = analyze_draws(cards_from_string("8c 9d"), cards_from_string("Js Qh 2c"));
        REQUIRE(d.is_gutshot);
        REQUIRE(d.straight_outs == 4);
    }

    SECTION("Broadway draw is one-sided") {
        auto d = analyze_draws(cards_from_string("Ac Kd"), cards_from_string("Qs Jh 2c"));
        REQUIRE_FALSE(d.is_open_ended);
        REQUIRE(d.is_gutshot);
        REQUIRE(d.straight_outs == 4);
    }

    SECTION("Combo draw does not double count") {
        auto d = analyze_draws(cards_from_string("8h 9h"), cards_from_string("Th Jh 2c"));
        REQUIRE(d.is_flush_draw);
        REQUIRE(d.is_open_ended);
        REQUIRE(d.total_outs == 15);
    }
}

TEST_CASE("Hand strength table", "[strength]") {
    SECTION("Pocket pair preflop") {
        auto hs = analyze_hand_strength(cards_from_string("As Ad"), {});
        REQUIRE(hs.category == HandCategory::PAIR);
        REQUIRE(hs.name == "One Pair");
        REQUIRE(hs.description == "Pair of Aces");
        REQUIRE(hs.strength == 25);
        REQUIRE(hs.outs == 0);
        REQUIRE(hs.potential_hands.empty());
    }

    SECTION("High card with a flush draw on the flop") {
        auto hs = analyze_hand_strength(cards_from_string("Ah Kh"), cards_from_string("Qh 7h 2c"));
        REQUIRE(hs.category == HandCategory::HIGH_CARD);
        REQUIRE(hs.description == "Ace high");
        REQUIRE(hs.strength == 20);
        REQUIRE(hs.outs == 9);
        REQUIRE(hs.potential_hands.size() == 1);
        REQUIRE(hs.potential_hands[0].name == "Flush");
        REQUIRE_THAT(hs.potential_hands[0].probability, Catch::Matchers::WithinAbs(0.36, 1e-9));
    }

    SECTION("Made hands") {
        auto full = analyze_hand_strength(cards_from_string("Kc Kd"), cards_from_string("Kh Tc Td"));
        REQUIRE(full.category == HandCategory::FULL_HOUSE);
        REQUIRE(full.strength == 82);
        REQUIRE(full.description == "Kings full of Tens");

        auto quads = analyze_hand_strength(cards_from_string("7c 7d"), cards_from_string("7h 7s 2c"));
        REQUIRE(quads.description == "Quad Sevens");
        REQUIRE(quads.strength == 90);
    }

    SECTION("Missing hole cards") {
        REQUIRE_THROWS_AS(analyze_hand_strength({}, cards_from_string("Qh 7h 2c")), std::invalid_argument);
    }
}

TEST_CASE("Rule of 2 and 4", "[strength][equity]") {
    REQUIRE(estimate_equity(9, Street::FLOP) == 36);
    REQUIRE(estimate_equity(9, Street::TURN) == 18);
    REQUIRE(estimate_equity(9, Street::RIVER) == 0);
    REQUIRE(estimate_equity(30, Street::FLOP) == 99);

    HandStrength hs;
    hs.strength = 25;
    REQUIRE(estimate_hand_vs_range(hs, 1) == 25);
    REQUIRE(estimate_hand_vs_range(hs, 3) == 9);
    REQUIRE(estimate_hand_vs_range(hs, 4) == 5);
}

TEST_CASE("Exact heads-up showdown equity", "[strength][equity]") {
    SECTION("Complete board") {
        double eq = calculate_showdown_equity(cards_from_string("As Ks"), cards_from_string("Qh Qd"),
                                              cards_from_string("Ac Kc 2h 3d 4s"));
        REQUIRE_THAT(eq, Catch::Matchers::WithinAbs(1.0, 1e-9));
    }

    SECTION("Board plays for both") {
        double eq = calculate_showdown_equity(cards_from_string("As Kc"), cards_from_string("Ad Kh"),
                                              cards_from_string("2c 3d 4h 5s 6c"));
        REQUIRE_THAT(eq, Catch::Matchers::WithinAbs(0.5, 1e-9));
    }

    SECTION("Turn to river") {
        // Rivière: Kh perd (carré de rois), les quatre Dix partagent (quinte Broadway)
        double eq = calculate_showdown_equity(cards_from_string("Ah Ad"), cards_from_string("Ks Kc"),
                                              cards_from_string("Ac Kd Qs Js"));
        REQUIRE_THAT(eq, Catch::Matchers::WithinAbs(41.0 / 44.0, 1e-9));
    }

    SECTION("Flop enumeration") {
        double eq = calculate_showdown_equity(cards_from_string("Ah Ad"), cards_from_string("Kh Kd"),
                                              cards_from_string("2c 7s 9d"));
        REQUIRE(eq > 0.85);
        REQUIRE(eq < 0.97);
    }

    SECTION("Invalid input") {
        REQUIRE_THROWS_AS(calculate_showdown_equity(cards_from_string("As Ks"), cards_from_string("Qh Qd"),
                                                    cards_from_string("2c 3d")),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(calculate_showdown_equity(cards_from_string("As Ks"), cards_from_string("As Qd"),
                                                    cards_from_string("2c 3d 4h")),
                          std::invalid_argument);
    }
}
