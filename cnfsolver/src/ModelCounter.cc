/**
 * @file ModelCounter.cc
 * @brief Component-caching model counter
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "cnfsolver/ModelCounter.hh"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <numeric>
#include <stdexcept>

namespace cnfsolver {

namespace {

constexpr std::size_t MAX_CACHE_ENTRIES = 1u << 18;

int find_root(std::vector<int>& parent, int index) {
    while (parent[index] != index) {
        parent[index] = parent[parent[index]];
        index = parent[index];
    }
    return index;
}

} // namespace

/**
 * @brief Normalizes the clauses once: duplicate literals and tautologies go
 *
 * @param num_vars Number of variables; models range over all of them
 * @param clauses DIMACS clauses
 * @throws std::invalid_argument on a zero or out-of-range literal
 */
ModelCounter::ModelCounter(int num_vars, const std::vector<std::vector<int>>& clauses)
    : num_vars_(num_vars)
    , has_empty_clause_(false)
    , decisions_(0)
    , deadline_(nullptr) {
    for (const auto& clause : clauses) {
        std::vector<int> lits = clause;
        for (int literal : lits) {
            if (literal == 0 || std::abs(literal) > num_vars_) {
                throw std::invalid_argument("Clause literal " + std::to_string(literal) + " out of range");
            }
        }
        std::sort(lits.begin(), lits.end());
        lits.erase(std::unique(lits.begin(), lits.end()), lits.end());

        bool tautology = false;
        for (int literal : lits) {
            if (std::binary_search(lits.begin(), lits.end(), -literal)) {
                tautology = true;
                break;
            }
        }
        if (tautology) {
            continue;
        }
        if (lits.empty()) {
            has_empty_clause_ = true;
        }
        clauses_.push_back(std::move(lits));
    }
}

/**
 * @brief Number of assignments of all variables that satisfy the clauses
 *        and @p assumptions
 *
 * Variables that occur in no remaining clause after unit propagation each
 * double the count.
 *
 * @throws std::invalid_argument if an assumption names an unknown variable
 * @throws TimeoutError if the deadline expires
 */
mpz_class ModelCounter::count(const std::vector<int>& assumptions, const Deadline& deadline) {
    for (int literal : assumptions) {
        if (literal == 0 || std::abs(literal) > num_vars_) {
            throw std::invalid_argument("Assumption on unknown variable " + std::to_string(literal));
        }
    }
    if (has_empty_clause_) {
        return 0;
    }

    deadline_ = &deadline;
    deadline.check();

    ClauseList reduced = clauses_;
    std::size_t num_fixed = 0;
    if (!propagate(reduced, assumptions, num_fixed)) {
        deadline_ = nullptr;
        return 0;
    }

    std::size_t num_free = static_cast<std::size_t>(num_vars_) - num_fixed - count_variables(reduced);
    mpz_class result;
    try {
        result = count_formula(reduced) * power_of_two(num_free);
    } catch (const TimeoutError&) {
        deadline_ = nullptr;
        throw;
    }
    deadline_ = nullptr;
    return result;
}

mpz_class ModelCounter::count_formula(const ClauseList& clauses) {
    if (clauses.empty()) {
        return 1;
    }
    mpz_class product = 1;
    for (auto& component : split_components(clauses)) {
        product *= count_component(std::move(component));
        if (product == 0) {
            break;
        }
    }
    return product;
}

/**
 * @brief Counts one connected component over its own variables
 *
 * The sorted clause list is the cache key. The cache is dropped as a whole
 * once it reaches MAX_CACHE_ENTRIES.
 */
mpz_class ModelCounter::count_component(ClauseList clauses) {
    if (deadline_ != nullptr) {
        deadline_->check();
    }

    std::sort(clauses.begin(), clauses.end());
    std::string key = cache_key(clauses);
    auto cached = cache_.find(key);
    if (cached != cache_.end()) {
        return cached->second;
    }

    // Branch on the most frequent variable, lowest on ties
    std::map<int, std::size_t> occurrences;
    for (const auto& clause : clauses) {
        for (int literal : clause) {
            ++occurrences[std::abs(literal)];
        }
    }
    int branch_var = 0;
    std::size_t best = 0;
    for (const auto& entry : occurrences) {
        if (entry.second > best) {
            best = entry.second;
            branch_var = entry.first;
        }
    }
    std::size_t num_vars = occurrences.size();

    mpz_class total = 0;
    for (int literal : {branch_var, -branch_var}) {
        ++decisions_;
        ClauseList reduced = clauses;
        std::size_t num_fixed = 0;
        if (!propagate(reduced, {literal}, num_fixed)) {
            continue;
        }
        std::size_t num_free = num_vars - num_fixed - count_variables(reduced);
        total += count_formula(reduced) * power_of_two(num_free);
    }

    if (cache_.size() >= MAX_CACHE_ENTRIES) {
        cache_.clear();
    }
    cache_.emplace(std::move(key), total);
    return total;
}

/**
 * @brief Unit propagation of @p units and of the unit clauses in @p clauses
 *
 * @param clauses Simplified in place: satisfied clauses go, false literals go
 * @param units Literals to assign first
 * @param num_fixed Incremented once per newly assigned variable
 * @return false on a conflict
 */
bool ModelCounter::propagate(ClauseList& clauses, std::vector<int> units, std::size_t& num_fixed) {
    for (const auto& clause : clauses) {
        if (clause.size() == 1) {
            units.push_back(clause[0]);
        }
    }

    std::map<int, bool> assigned;
    std::size_t head = 0;
    while (head < units.size()) {
        int literal = units[head++];
        int var = std::abs(literal);
        bool value = literal > 0;

        auto it = assigned.find(var);
        if (it != assigned.end()) {
            if (it->second != value) {
                return false;
            }
            continue;
        }
        assigned.emplace(var, value);
        ++num_fixed;

        ClauseList next;
        next.reserve(clauses.size());
        for (auto& clause : clauses) {
            bool satisfied = false;
            bool falsified_literal = false;
            for (int l : clause) {
                if (l == literal) {
                    satisfied = true;
                    break;
                }
                if (l == -literal) {
                    falsified_literal = true;
                }
            }
            if (satisfied) {
                continue;
            }
            if (!falsified_literal) {
                next.push_back(std::move(clause));
                continue;
            }

            std::vector<int> shortened;
            shortened.reserve(clause.size() - 1);
            for (int l : clause) {
                if (l != -literal) {
                    shortened.push_back(l);
                }
            }
            if (shortened.empty()) {
                return false;
            }
            if (shortened.size() == 1) {
                units.push_back(shortened[0]);
            }
            next.push_back(std::move(shortened));
        }
        clauses = std::move(next);
    }
    return true;
}

/**
 * @brief Groups clauses that share variables (union-find over variables)
 */
std::vector<ModelCounter::ClauseList> ModelCounter::split_components(const ClauseList& clauses) {
    std::map<int, int> index_of;
    for (const auto& clause : clauses) {
        for (int literal : clause) {
            index_of.emplace(std::abs(literal), 0);
        }
    }
    int next_index = 0;
    for (auto& entry : index_of) {
        entry.second = next_index++;
    }

    std::vector<int> parent(index_of.size());
    std::iota(parent.begin(), parent.end(), 0);
    for (const auto& clause : clauses) {
        int first = find_root(parent, index_of[std::abs(clause[0])]);
        for (std::size_t k = 1; k < clause.size(); ++k) {
            int other = find_root(parent, index_of[std::abs(clause[k])]);
            if (other != first) {
                parent[std::max(first, other)] = std::min(first, other);
                first = std::min(first, other);
            }
        }
    }

    // Components ordered by their lowest variable
    std::map<int, ClauseList> by_root;
    for (const auto& clause : clauses) {
        by_root[find_root(parent, index_of[std::abs(clause[0])])].push_back(clause);
    }

    std::vector<ClauseList> components;
    components.reserve(by_root.size());
    for (auto& entry : by_root) {
        components.push_back(std::move(entry.second));
    }
    return components;
}

std::size_t ModelCounter::count_variables(const ClauseList& clauses) {
    std::vector<int> vars;
    for (const auto& clause : clauses) {
        for (int literal : clause) {
            vars.push_back(std::abs(literal));
        }
    }
    std::sort(vars.begin(), vars.end());
    return static_cast<std::size_t>(std::unique(vars.begin(), vars.end()) - vars.begin());
}

std::string ModelCounter::cache_key(const ClauseList& clauses) {
    std::string key;
    for (const auto& clause : clauses) {
        for (int literal : clause) {
            key += std::to_string(literal);
            key += ' ';
        }
        key += "0 ";
    }
    return key;
}

mpz_class ModelCounter::power_of_two(std::size_t exponent) {
    mpz_class result;
    mpz_ui_pow_ui(result.get_mpz_t(), 2, static_cast<unsigned long>(exponent));
    return result;
}

} // namespace cnfsolver
