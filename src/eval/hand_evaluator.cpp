// ─────────────────────────────────────────────────────────────────────────────
//  src/eval/hand_evaluator.cpp
//  Évaluateur par énumération: toutes les combinaisons de 5 cartes sont
//  scorées puis la meilleure est retenue (Hold'em, Omaha high, Omaha low).
// ─────────────────────────────────────────────────────────────────────────────
#include "eval/hand_evaluator.hpp"
#include "core/cards.hpp"
#include <algorithm>
#include <array>
#include <functional>
#include <map>
#include <numeric>
#include <set>
#include <vector>

namespace poker_table {

namespace {

void check_cards(const std::vector<Card>& cards) {
    std::array<bool, NUM_CARDS> seen{};
    for (Card c : cards) {
        if (!is_valid_card(c)) {
            throw InvalidInputError("Invalid card index " + std::to_string(static_cast<int>(c)));
        }
        if (seen[c]) {
            throw InvalidInputError("Duplicate card " + to_string(c));
        }
        seen[c] = true;
    }
}

// Appelle fn(indices) pour chaque combinaison de k éléments parmi n
template <typename Fn>
void for_each_combination(int n, int k, Fn&& fn) {
    if (k > n || k <= 0) return;
    std::vector<int> idx(k);
    std::iota(idx.begin(), idx.end(), 0);
    while (true) {
        fn(idx);
        int i = k - 1;
        while (i >= 0 && idx[i] == n - k + i) --i;
        if (i < 0) return;
        ++idx[i];
        for (int j = i + 1; j < k; ++j) idx[j] = idx[j - 1] + 1;
    }
}

// Hauteur de la suite, 0 si pas de suite. La roue (A-2-3-4-5) vaut 5.
int straight_high(const std::vector<int>& desc_values) {
    std::set<int> unique(desc_values.begin(), desc_values.end());
    if (unique.size() != 5) return 0;
    int hi = *unique.rbegin();
    int lo = *unique.begin();
    if (hi - lo == 4) return hi;
    if (unique == std::set<int>{2, 3, 4, 5, 14}) return 5;
    return 0;
}

EvaluatedHand make_hand(HandCategory cat, std::vector<int> kickers, std::string description,
                        const std::array<Card, 5>& cards) {
    EvaluatedHand h;
    h.category    = cat;
    h.value       = static_cast<int>(cat);
    h.kickers     = std::move(kickers);
    h.description = std::move(description);
    h.cards       = cards;
    return h;
}

int low_value_of(Card c) {
    int v = rank_value(c);
    return v == 14 ? 1 : v;
}

} // namespace

// -----------------------------------------------------------------------------
//  Scoring de 5 cartes
// -----------------------------------------------------------------------------
EvaluatedHand evaluate_five_card_hand(const std::array<Card, 5>& input) {
    check_cards(std::vector<Card>(input.begin(), input.end()));

    std::array<Card, 5> cards = input;
    std::sort(cards.begin(), cards.end(), [](Card a, Card b) {
        return rank_value(a) > rank_value(b);
    });

    std::vector<int> values;
    for (Card c : cards) values.push_back(rank_value(c));

    bool flush = std::all_of(cards.begin(), cards.end(), [&](Card c) {
        return get_suit(c) == get_suit(cards[0]);
    });
    int high = straight_high(values);
    if (high == 5) {
        // Roue: l'As passe en dernier
        std::rotate(cards.begin(), cards.begin() + 1, cards.end());
    }

    // Groupes (nombre, valeur) triés par nombre puis valeur décroissants
    std::map<int, int> counts;
    for (int v : values) counts[v]++;
    std::vector<std::pair<int, int>> groups;
    for (const auto& [v, n] : counts) groups.emplace_back(n, v);
    std::sort(groups.begin(), groups.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second > b.second;
    });

    if (flush && high != 0) {
        if (high == 14) {
            return make_hand(HandCategory::ROYAL_FLUSH, {14, 13, 12, 11, 10}, "Royal Flush", cards);
        }
        return make_hand(HandCategory::STRAIGHT_FLUSH, {high},
                         "Straight Flush, " + rank_name(high) + " high", cards);
    }
    if (groups[0].first == 4) {
        int quad = groups[0].second;
        return make_hand(HandCategory::FOUR_OF_A_KIND, {quad, groups[1].second},
                         "Four of a Kind, " + rank_name_plural(quad), cards);
    }
    if (groups[0].first == 3 && groups[1].first == 2) {
        int trips = groups[0].second;
        int pair  = groups[1].second;
        return make_hand(HandCategory::FULL_HOUSE, {trips, pair},
                         "Full House, " + rank_name_plural(trips) + " full of " + rank_name_plural(pair), cards);
    }
    if (flush) {
        return make_hand(HandCategory::FLUSH, values, "Flush, " + rank_name(values[0]) + " high", cards);
    }
    if (high != 0) {
        return make_hand(HandCategory::STRAIGHT, {high}, "Straight, " + rank_name(high) + " high", cards);
    }
    if (groups[0].first == 3) {
        int trips = groups[0].second;
        return make_hand(HandCategory::THREE_OF_A_KIND, {trips, groups[1].second, groups[2].second},
                         "Three of a Kind, " + rank_name_plural(trips), cards);
    }
    if (groups[0].first == 2 && groups[1].first == 2) {
        int hi = groups[0].second;
        int lo = groups[1].second;
        return make_hand(HandCategory::TWO_PAIR, {hi, lo, groups[2].second},
                         "Two Pair, " + rank_name_plural(hi) + " and " + rank_name_plural(lo), cards);
    }
    if (groups[0].first == 2) {
        int pair = groups[0].second;
        return make_hand(HandCategory::PAIR, {pair, groups[1].second, groups[2].second, groups[3].second},
                         "Pair of " + rank_name_plural(pair), cards);
    }
    return make_hand(HandCategory::HIGH_CARD, values, rank_name(values[0]) + " high", cards);
}

// -----------------------------------------------------------------------------
//  Meilleure main parmi N >= 5 cartes
// -----------------------------------------------------------------------------
EvaluatedHand evaluate_hand(const std::vector<Card>& cards) {
    if (cards.size() < 5) {
        throw InvalidInputError("evaluate_hand requires at least 5 cards, got " + std::to_string(cards.size()));
    }
    check_cards(cards);

    std::optional<EvaluatedHand> best;
    for_each_combination(static_cast<int>(cards.size()), 5, [&](const std::vector<int>& idx) {
        std::array<Card, 5> combo{};
        for (int i = 0; i < 5; ++i) combo[i] = cards[idx[i]];
        EvaluatedHand h = evaluate_five_card_hand(combo);
        if (!best || compare_hands(h, *best) > 0) best = std::move(h);
    });
    return *best;
}

// -----------------------------------------------------------------------------
//  Omaha: exactement 2 cartes privées + 3 cartes du board
// -----------------------------------------------------------------------------
EvaluatedHand evaluate_omaha_hand(const std::vector<Card>& hole, const std::vector<Card>& board) {
    if (hole.size() < 2 || board.size() < 3) {
        throw InvalidInputError("evaluate_omaha_hand requires at least 2 hole cards and 3 board cards");
    }
    std::vector<Card> all(hole);
    all.insert(all.end(), board.begin(), board.end());
    check_cards(all);

    std::optional<EvaluatedHand> best;
    for_each_combination(static_cast<int>(hole.size()), 2, [&](const std::vector<int>& h) {
        for_each_combination(static_cast<int>(board.size()), 3, [&](const std::vector<int>& b) {
            std::array<Card, 5> combo = {hole[h[0]], hole[h[1]], board[b[0]], board[b[1]], board[b[2]]};
            EvaluatedHand eh = evaluate_five_card_hand(combo);
            if (!best || compare_hands(eh, *best) > 0) best = std::move(eh);
        });
    });
    return *best;
}

std::optional<LowHand> evaluate_omaha_low_hand(const std::vector<Card>& hole, const std::vector<Card>& board) {
    if (hole.size() < 2 || board.size() < 3) {
        return std::nullopt;
    }

    std::optional<LowHand> best;
    for_each_combination(static_cast<int>(hole.size()), 2, [&](const std::vector<int>& h) {
        for_each_combination(static_cast<int>(board.size()), 3, [&](const std::vector<int>& b) {
            std::array<Card, 5> combo = {hole[h[0]], hole[h[1]], board[b[0]], board[b[1]], board[b[2]]};

            std::vector<int> ranks;
            for (Card c : combo) ranks.push_back(low_value_of(c));
            std::set<int> unique(ranks.begin(), ranks.end());
            if (unique.size() != 5) return;    // Paire: disqualifiée
            if (*unique.rbegin() > 8) return;  // Pas 8-or-better

            std::sort(ranks.begin(), ranks.end(), std::greater<int>());
            int value = std::accumulate(ranks.begin(), ranks.end(), 0,
                                        [](int acc, int r) { return acc * 15 + r; });
            if (best && value >= best->value) return;

            LowHand low;
            low.value = value;
            low.ranks = ranks;
            std::sort(combo.begin(), combo.end(), [](Card x, Card y) {
                return low_value_of(x) > low_value_of(y);
            });
            low.cards = combo;
            std::string desc;
            for (std::size_t i = 0; i < ranks.size(); ++i) {
                if (i) desc += "-";
                desc += std::to_string(ranks[i]);
            }
            low.description = desc + " Low";
            best = std::move(low);
        });
    });
    return best;
}

// -----------------------------------------------------------------------------
//  Comparaison / gagnants
// -----------------------------------------------------------------------------
int compare_hands(const EvaluatedHand& a, const EvaluatedHand& b) {
    if (a.value != b.value) return a.value > b.value ? 1 : -1;
    std::size_t n = std::min(a.kickers.size(), b.kickers.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (a.kickers[i] != b.kickers[i]) return a.kickers[i] > b.kickers[i] ? 1 : -1;
    }
    return 0;
}

int compare_low_hands(const LowHand& a, const LowHand& b) {
    if (a.value == b.value) return 0;
    return a.value < b.value ? 1 : -1;
}

std::vector<ContenderHand> determine_winners(const std::vector<ContenderHand>& contenders) {
    std::vector<ContenderHand> winners;
    for (const auto& c : contenders) {
        if (winners.empty()) {
            winners.push_back(c);
            continue;
        }
        int cmp = compare_hands(c.hand, winners.front().hand);
        if (cmp > 0) {
            winners.clear();
            winners.push_back(c);
        } else if (cmp == 0) {
            winners.push_back(c);
        }
    }
    return winners;
}

std::string hand_category_to_string(HandCategory category) {
    switch (category) {
        case HandCategory::HIGH_CARD:       return "High Card";
        case HandCategory::PAIR:            return "One Pair";
        case HandCategory::TWO_PAIR:        return "Two Pair";
        case HandCategory::THREE_OF_A_KIND: return "Three of a Kind";
        case HandCategory::STRAIGHT:        return "Straight";
        case HandCategory::FLUSH:           return "Flush";
        case HandCategory::FULL_HOUSE:      return "Full House";
        case HandCategory::FOUR_OF_A_KIND:  return "Four of a Kind";
        case HandCategory::STRAIGHT_FLUSH:  return "Straight Flush";
        case HandCategory::ROYAL_FLUSH:     return "Royal Flush";
    }
    return "Unknown";
}

} // namespace poker_table
