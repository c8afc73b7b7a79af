#include <catch2/catch.hpp>
#include "eval/hand_evaluator.hpp"
#include "core/cards.hpp"
#include "poker_table/errors.h"

#include <string>
#include <vector>

using namespace poker_table;

namespace {

EvaluatedHand eval(const std::string& cards) {
    return evaluate_hand(cards_from_string(cards));
}

} // namespace

TEST_CASE("Hand categories", "[evaluator]") {
    REQUIRE(eval("As Ks Qs Js Ts 2c 3d").category == HandCategory::ROYAL_FLUSH);
    REQUIRE(eval("9h 8h 7h 6h 5h Ac Ad").category == HandCategory::STRAIGHT_FLUSH);
    REQUIRE(eval("7c 7d 7h 7s Kd 2c 3c").category == HandCategory::FOUR_OF_A_KIND);
    REQUIRE(eval("Kc Kd Kh Tc Td 2s 3s").category == HandCategory::FULL_HOUSE);
    REQUIRE(eval("Ah 9h 6h 4h 2h Kc Qd").category == HandCategory::FLUSH);
    REQUIRE(eval("9c 8d 7h 6s 5c Kd 2h").category == HandCategory::STRAIGHT);
    REQUIRE(eval("Qc Qd Qh 8s 5c 3d 2h").category == HandCategory::THREE_OF_A_KIND);
    REQUIRE(eval("Jc Jd 4h 4s Ac 8d 2h").category == HandCategory::TWO_PAIR);
    REQUIRE(eval("Tc Td Ah 8s 5c 3d 2h").category == HandCategory::PAIR);
    REQUIRE(eval("Ac Jd 9h 7s 5c 3d 2h").category == HandCategory::HIGH_CARD);
}

TEST_CASE("Hand descriptions and kickers", "[evaluator]") {
    auto full = eval("Kc Kd Kh Tc Td 2s 3s");
    REQUIRE(full.description == "Full House, Kings full of Tens");
    REQUIRE(full.kickers == std::vector<int>{13, 10});
    REQUIRE(full.value == 7);

    auto two_pair = eval("Jc Jd 4h 4s Ac 8d 2h");
    REQUIRE(two_pair.description == "Two Pair, Jacks and Fours");
    REQUIRE(two_pair.kickers == std::vector<int>{11, 4, 14});

    auto pair = eval("Tc Td Ah 8s 5c 3d 2h");
    REQUIRE(pair.description == "Pair of Tens");
    REQUIRE(pair.kickers == std::vector<int>{10, 14, 8, 5});

    REQUIRE(eval("6c 6d 6h 6s Kd 2c 3c").description == "Four of a Kind, Sixes");
    REQUIRE(eval("Ac Jd 9h 7s 5c 3d 2h").description == "Ace high");
    REQUIRE(hand_category_to_string(HandCategory::PAIR) == "One Pair");
}

TEST_CASE("Wheel straight", "[evaluator]") {
    auto wheel = evaluate_hand(cards_from_string("As 2h 3d 4c 5s"));
    REQUIRE(wheel.category == HandCategory::STRAIGHT);
    REQUIRE(wheel.kickers.front() == 5);
    REQUIRE(wheel.description == "Straight, Five high");

    auto six_high = evaluate_hand(cards_from_string("2h 3d 4c 5s 6h"));
    REQUIRE(compare_hands(six_high, wheel) > 0);
    REQUIRE(compare_hands(wheel, six_high) < 0);
}

TEST_CASE("Evaluation is deterministic", "[evaluator]") {
    const auto cards = cards_from_string("Ah Kd 9c 9s 4h 4d 2c");
    auto a = evaluate_hand(cards);
    auto b = evaluate_hand(cards);
    REQUIRE(a.category == b.category);
    REQUIRE(a.kickers == b.kickers);
    REQUIRE(a.description == b.description);
    REQUIRE(compare_hands(a, a) == 0);
    REQUIRE(compare_hands(a, b) == 0);
}

TEST_CASE("Kickers break ties", "[evaluator]") {
    auto ak = eval("Ac Kd 9h 9s 5c 3d 2h");
    auto aq = eval("Ad Qd 9c 9d 5h 3s 2c");
    REQUIRE(compare_hands(ak, aq) > 0);

    SECTION("Board plays for both") {
        auto a = eval("2c 3d Ah Kh Qh Jh 9s");
        auto b = eval("2d 3c Ah Kh Qh Jh 9s");
        REQUIRE(compare_hands(a, b) == 0);
    }
}

TEST_CASE("determine_winners keeps ties in input order", "[evaluator]") {
    std::vector<ContenderHand> contenders = {
        {"p1", eval("2c 3d As Kh Qh Jd 9s")},
        {"p2", eval("Qc Qd As Kh Qh Jd 9s")},
        {"p3", eval("2h 3c As Kh Qh Jd 9s")},
        {"p4", eval("Qs 4d As Kh Qh Jd 9s")},
    };
    auto winners = determine_winners(contenders);
    REQUIRE(winners.size() == 1);
    REQUIRE(winners[0].id == "p2");

    std::vector<ContenderHand> chop = {contenders[0], contenders[2]};
    auto split = determine_winners(chop);
    REQUIRE(split.size() == 2);
    REQUIRE(split[0].id == "p1");
    REQUIRE(split[1].id == "p3");
}

TEST_CASE("Omaha uses exactly two hole cards", "[evaluator][omaha]") {
    // Quatre piques en main: seules deux comptent, avec trois piques du board
    auto hole  = cards_from_string("As Ks Qs Js");
    auto board = cards_from_string("2s 7s 8d 9c 3s");
    auto omaha = evaluate_omaha_hand(hole, board);
    REQUIRE(omaha.category == HandCategory::FLUSH);

    // Le board seul ferait une suite, mais Omaha impose deux privées
    auto hole2  = cards_from_string("Ac Ad Kc Kd");
    auto board2 = cards_from_string("5h 6s 7d 8c 9h");
    auto h2 = evaluate_omaha_hand(hole2, board2);
    REQUIRE(h2.category == HandCategory::PAIR);
    REQUIRE(h2.kickers.front() == 14);
}

TEST_CASE("Omaha low 8-or-better", "[evaluator][omaha]") {
    auto board = cards_from_string("2c 5d 7h Kc Qd");

    SECTION("Qualifying low") {
        auto low = evaluate_omaha_low_hand(cards_from_string("Ah 3s Ks Kd"), board);
        REQUIRE(low.has_value());
        REQUIRE(low->description == "7-5-3-2-1 Low");
        REQUIRE(low->ranks == std::vector<int>{7, 5, 3, 2, 1});
    }

    SECTION("Better low wins") {
        auto a = evaluate_omaha_low_hand(cards_from_string("Ah 3s Ks Kd"), board);
        auto b = evaluate_omaha_low_hand(cards_from_string("Ad 4s Jd Jh"), board);
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        // 7-5-3-2-1 contre 7-5-4-2-1
        REQUIRE(compare_low_hands(*a, *b) > 0);
        REQUIRE(compare_low_hands(*b, *a) < 0);
        REQUIRE(compare_low_hands(*a, *a) == 0);
    }

    SECTION("No qualifying low") {
        REQUIRE_FALSE(evaluate_omaha_low_hand(cards_from_string("9h Ts Js Jd"), board).has_value());
        auto high_board = cards_from_string("9c Td Jh Kc Qd");
        REQUIRE_FALSE(evaluate_omaha_low_hand(cards_from_string("Ah 2s 3s 4d"), high_board).has_value());
        REQUIRE_FALSE(evaluate_omaha_low_hand(cards_from_string("Ah 2s"), cards_from_string("3c 4d")).has_value());
    }
}

TEST_CASE("Invalid evaluator input", "[evaluator][errors]") {
    REQUIRE_THROWS_AS(evaluate_hand(cards_from_string("As Kd Qh Jc")), InvalidInputError);
    REQUIRE_THROWS_AS(evaluate_hand({}), InvalidInputError);
    REQUIRE_THROWS_AS(evaluate_hand(cards_from_string("As As Qh Jc Tc")), InvalidInputError);
    REQUIRE_THROWS_AS(evaluate_omaha_hand(cards_from_string("As"), cards_from_string("2c 3d 4h")),
                      InvalidInputError);

    try {
        evaluate_hand(cards_from_string("As Kd"));
        FAIL("InvalidInputError attendue");
    } catch (const InvalidInputError& e) {
        REQUIRE(e.code() == ErrorCode::INVALID_INPUT);
    }
}
