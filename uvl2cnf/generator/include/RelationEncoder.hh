/**
 * @file RelationEncoder.hh
 * @brief Encoder for converting feature relations to CNF clauses
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef RELATIONENCODER_H
#define RELATIONENCODER_H

#include "CNFModel.hh"
#include "Relation.hh"

#include <memory>
#include <vector>

/**
 * @class RelationEncoder
 * @brief Encodes feature model relations as CNF clauses
 *
 * Every relation is encoded with feature variables only, in both CNF modes:
 *
 * **MANDATORY** (parent <=> child): (~p | c) & (~c | p)
 *
 * **OPTIONAL** (child => parent): (~c | p)
 *
 * **OR** (parent <=> at least one child): (~p | c1 | ... | cn), plus (~ci | p)
 *
 * **ALTERNATIVE** (parent <=> exactly one child): the OR clauses plus
 * (~ci | ~cj) for every pair i < j
 *
 * **CARDINALITY [m..n]** (parent => between m and n children):
 * - (~ci | p) for every child,
 * - at least m: (~p | OR of S) for every subset S of k - m + 1 children
 *   (k children in total); if m > k the parent can never be selected,
 * - at most n: (OR of ~c for c in S) for every subset S of n + 1 children.
 *
 * @code
 * CNFModel cnf;
 * RelationEncoder encoder(cnf);
 * encoder.encode_relation(mandatory_relation);  // parent <=> child
 * @endcode
 */
class RelationEncoder {
private:
    CNFModel& cnf_model;

public:
    /**
     * @brief Constructs an encoder for the given CNF model
     *
     * @param model CNF model receiving the clauses; every feature must already
     *        be declared in it
     */
    explicit RelationEncoder(CNFModel& model);

    /**
     * @brief Encodes a relation into CNF clauses, dispatching on its type
     *
     * @param relation The relation to encode
     * @throws std::logic_error if the relation violates the arity of its type
     */
    void encode_relation(const std::shared_ptr<Relation>& relation);

    /**
     * @brief Generates all combinations of k elements from n
     *
     * @return Index combinations in lexicographic order,
     *         e.g. generate_combinations(3, 2) = {{0,1}, {0,2}, {1,2}}
     */
    static std::vector<std::vector<int>> generate_combinations(int n, int k);

private:
    void encode_mandatory(const std::shared_ptr<Relation>& relation);
    void encode_optional(const std::shared_ptr<Relation>& relation);
    void encode_or(const std::shared_ptr<Relation>& relation);
    void encode_alternative(const std::shared_ptr<Relation>& relation);
    void encode_cardinality(const std::shared_ptr<Relation>& relation);

    std::vector<int> child_variables(const std::shared_ptr<Relation>& relation) const;
};

#endif // RELATIONENCODER_H
