#include "eval/hand_strength.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <array>
#include <map>
#include <set>
#include <stdexcept>

namespace poker_table {

namespace {

int base_strength(HandCategory c) {
    switch (c) {
        case HandCategory::ROYAL_FLUSH:     return 100;
        case HandCategory::STRAIGHT_FLUSH:  return 95;
        case HandCategory::FOUR_OF_A_KIND:  return 90;
        case HandCategory::FULL_HOUSE:      return 82;
        case HandCategory::FLUSH:           return 75;
        case HandCategory::STRAIGHT:        return 68;
        case HandCategory::THREE_OF_A_KIND: return 55;
        case HandCategory::TWO_PAIR:        return 45;
        case HandCategory::PAIR:            return 25;
        case HandCategory::HIGH_CARD:       return 10;
    }
    return 0;
}

struct MadeHand {
    HandCategory     category = HandCategory::HIGH_CARD;
    std::vector<int> ranks; // Rangs significatifs (même ordre que les kickers)
};

// Catégorie faite: évaluateur à partir de 5 cartes, comptage des rangs en dessous
MadeHand made_hand(const std::vector<Card>& cards) {
    if (cards.size() >= 5) {
        EvaluatedHand h = evaluate_hand(cards);
        return {h.category, h.kickers};
    }
    std::map<int, int> counts;
    for (Card c : cards) counts[rank_value(c)]++;
    std::vector<std::pair<int, int>> groups;
    for (const auto& [v, n] : counts) groups.emplace_back(n, v);
    std::sort(groups.begin(), groups.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second > b.second;
    });

    MadeHand m;
    if (groups.empty()) return m;
    if (groups[0].first == 4) {
        m.category = HandCategory::FOUR_OF_A_KIND;
        m.ranks = {groups[0].second};
    } else if (groups[0].first == 3) {
        m.category = HandCategory::THREE_OF_A_KIND;
        m.ranks = {groups[0].second};
    } else if (groups[0].first == 2 && groups.size() > 1 && groups[1].first == 2) {
        m.category = HandCategory::TWO_PAIR;
        m.ranks = {groups[0].second, groups[1].second};
    } else if (groups[0].first == 2) {
        m.category = HandCategory::PAIR;
        m.ranks = {groups[0].second};
    } else {
        m.ranks = {groups[0].second};
    }
    return m;
}

std::string short_description(const MadeHand& m) {
    switch (m.category) {
        case HandCategory::FOUR_OF_A_KIND:
            return "Quad " + rank_name_plural(m.ranks[0]);
        case HandCategory::FULL_HOUSE:
            return rank_name_plural(m.ranks[0]) + " full of " + rank_name_plural(m.ranks[1]);
        case HandCategory::THREE_OF_A_KIND:
            return "Trip " + rank_name_plural(m.ranks[0]);
        case HandCategory::TWO_PAIR:
            return rank_name_plural(m.ranks[0]) + " and " + rank_name_plural(m.ranks[1]);
        case HandCategory::PAIR:
            return "Pair of " + rank_name_plural(m.ranks[0]);
        case HandCategory::HIGH_CARD:
            return rank_name(m.ranks[0]) + " high";
        default:
            return hand_category_to_string(m.category);
    }
}

struct StraightDraw {
    bool open_ended = false;
    bool gutshot    = false;
    int  outs       = 0;
};

// sorted_unique: rangs distincts triés croissants (As = 14 uniquement)
StraightDraw analyze_straight_draw(const std::vector<int>& sorted_unique) {
    StraightDraw d;
    if (sorted_unique.size() < 4) return d;

    // 4 rangs consécutifs: ouvert des deux côtés sauf contre le 2 ou l'As
    for (std::size_t i = 0; i + 4 <= sorted_unique.size(); ++i) {
        if (sorted_unique[i + 3] - sorted_unique[i] == 3) {
            d.open_ended = sorted_unique[i] > 2 && sorted_unique[i + 3] < 14;
            d.gutshot    = !d.open_ended;
            d.outs       = d.open_ended ? 8 : 4;
            return d;
        }
    }
    // 4 rangs sur 5 valeurs: ventrale
    for (std::size_t i = 0; i + 4 <= sorted_unique.size(); ++i) {
        if (sorted_unique[i + 3] - sorted_unique[i] == 4) {
            d.gutshot = true;
            d.outs    = 4;
            return d;
        }
    }
    return d;
}

std::vector<PotentialHand> potential_hands(const DrawAnalysis& draws, std::size_t board_cards) {
    std::vector<PotentialHand> out;
    const int cards_to_come = board_cards < 5 ? 5 - static_cast<int>(board_cards) : 0;
    if (cards_to_come == 0) return out;

    const int multiplier = cards_to_come == 2 ? 4 : 2;
    auto probability = [&](int outs) { return std::min(0.99, (outs * multiplier) / 100.0); };

    if (draws.is_flush_draw) {
        out.push_back({HandCategory::FLUSH, "Flush", draws.flush_outs, probability(draws.flush_outs)});
    }
    if (draws.is_open_ended) {
        out.push_back({HandCategory::STRAIGHT, "Straight", draws.straight_outs, probability(draws.straight_outs)});
    }
    if (draws.is_gutshot) {
        out.push_back({HandCategory::STRAIGHT, "Straight (Gutshot)", draws.straight_outs, probability(draws.straight_outs)});
    }
    return out;
}

} // namespace

// -----------------------------------------------------------------------------
//  Tirages
// -----------------------------------------------------------------------------
DrawAnalysis analyze_draws(const std::vector<Card>& hole, const std::vector<Card>& board) {
    std::vector<Card> all(hole);
    all.insert(all.end(), board.begin(), board.end());

    DrawAnalysis d;
    std::array<int, 4> suit_counts{};
    for (Card c : all) suit_counts[static_cast<int>(get_suit(c))]++;
    d.is_flush_draw = std::any_of(suit_counts.begin(), suit_counts.end(), [](int n) { return n == 4; });
    d.flush_outs    = d.is_flush_draw ? 9 : 0;

    std::set<int> unique;
    for (Card c : all) unique.insert(rank_value(c));
    StraightDraw s = analyze_straight_draw(std::vector<int>(unique.begin(), unique.end()));
    d.is_open_ended    = s.open_ended;
    d.is_gutshot       = s.gutshot;
    d.is_straight_draw = s.open_ended || s.gutshot;
    d.straight_outs    = s.outs;

    // Les cartes de la couleur qui complètent aussi la quinte ne comptent qu'une fois
    int total = d.flush_outs + d.straight_outs;
    if (d.is_flush_draw && d.is_straight_draw) total -= 2;
    d.total_outs = std::max(0, total);
    return d;
}

// -----------------------------------------------------------------------------
//  Force de la main
// -----------------------------------------------------------------------------
HandStrength analyze_hand_strength(const std::vector<Card>& hole, const std::vector<Card>& board) {
    if (hole.empty()) {
        throw std::invalid_argument("analyze_hand_strength requires hole cards");
    }
    std::vector<Card> all(hole);
    all.insert(all.end(), board.begin(), board.end());

    MadeHand made = made_hand(all);
    DrawAnalysis draws = analyze_draws(hole, board);

    int strength = base_strength(made.category);
    if (made.category == HandCategory::HIGH_CARD || made.category == HandCategory::PAIR) {
        if (draws.is_flush_draw) strength += 10;
        if (draws.is_open_ended) strength += 8;
        if (draws.is_gutshot)    strength += 4;
    }

    HandStrength hs;
    hs.category        = made.category;
    hs.name            = hand_category_to_string(made.category);
    hs.description     = short_description(made);
    hs.strength        = std::clamp(strength, 0, 100);
    hs.outs            = draws.total_outs;
    hs.potential_hands = potential_hands(draws, board.size());
    spdlog::trace("Force {} ({}) outs {}", hs.strength, hs.description, hs.outs);
    return hs;
}

// -----------------------------------------------------------------------------
//  Équité
// -----------------------------------------------------------------------------
int estimate_equity(int outs, Street street) {
    int multiplier = 0;
    if (street == Street::FLOP) multiplier = 4;
    else if (street == Street::TURN) multiplier = 2;
    return std::min(99, std::max(0, outs) * multiplier);
}

int estimate_hand_vs_range(const HandStrength& hand, int opponent_count) {
    const int reduction = (opponent_count - 1) * 8;
    return std::max(5, hand.strength - reduction);
}

double calculate_showdown_equity(const std::vector<Card>& hero,
                                 const std::vector<Card>& villain,
                                 const std::vector<Card>& board) {
    if (hero.size() != 2 || villain.size() != 2) {
        throw std::invalid_argument("calculate_showdown_equity: les mains doivent avoir 2 cartes");
    }
    if (board.size() < 3 || board.size() > 5) {
        throw std::invalid_argument("calculate_showdown_equity: board de 3 a 5 cartes requis");
    }

    std::array<bool, NUM_CARDS> used{};
    for (const auto* group : {&hero, &villain, &board}) {
        for (Card c : *group) {
            if (!is_valid_card(c) || used[c]) {
                throw std::invalid_argument("calculate_showdown_equity: carte invalide ou en double " + to_string(c));
            }
            used[c] = true;
        }
    }
    std::vector<Card> remaining;
    for (Card c = 0; c < NUM_CARDS; ++c) {
        if (!used[c]) remaining.push_back(c);
    }

    long hero_wins = 0;
    long ties = 0;
    long total_runouts = 0;

    auto score = [&](const std::vector<Card>& final_board) {
        std::vector<Card> h(hero);
        h.insert(h.end(), final_board.begin(), final_board.end());
        std::vector<Card> v(villain);
        v.insert(v.end(), final_board.begin(), final_board.end());
        int cmp = compare_hands(evaluate_hand(h), evaluate_hand(v));
        if (cmp > 0) hero_wins++;
        else if (cmp == 0) ties++;
        total_runouts++;
    };

    if (board.size() == 5) {
        score(board);
    } else if (board.size() == 4) { // Turn -> River
        for (Card r : remaining) {
            std::vector<Card> final_board = board;
            final_board.push_back(r);
            score(final_board);
        }
    } else { // Flop -> Turn & River
        for (std::size_t i = 0; i < remaining.size(); ++i) {
            for (std::size_t j = i + 1; j < remaining.size(); ++j) {
                std::vector<Card> final_board = board;
                final_board.push_back(remaining[i]);
                final_board.push_back(remaining[j]);
                score(final_board);
            }
        }
    }

    double equity = (static_cast<double>(hero_wins) + 0.5 * static_cast<double>(ties)) / static_cast<double>(total_runouts);
    spdlog::debug("Équité exacte: {:.4f} sur {} runouts", equity, total_runouts);
    return equity;
}

} // namespace poker_table
