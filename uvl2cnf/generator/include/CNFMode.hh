/**
 * @file CNFMode.hh
 * @brief Constraint-to-CNF conversion modes
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef CNFMODE_H
#define CNFMODE_H

/**
 * @enum CNFMode
 * @brief Strategy for lowering cross-tree constraints to clauses
 *
 * Group relations are encoded the same way in both modes; only constraints differ.
 *
 * **STRAIGHTFORWARD**: negation normal form plus distribution. Uses feature
 * variables only, but nested disjunctions of conjunctions can multiply clauses.
 *
 * **TSEITIN**: one auxiliary variable per compound sub-formula, defined by a
 * full equivalence (t <=> a & b, t <=> a | b). The clause count stays linear
 * and every auxiliary variable is determined by the feature variables, so
 * counting and enumerating projected on features gives the same results as
 * in straightforward mode.
 *
 * @code
 * // Constraint: (A & B) | (C & D)
 * // STRAIGHTFORWARD: (A|C) (A|D) (B|C) (B|D)
 * // TSEITIN: t1 <=> A&B, t2 <=> C&D, t3 <=> t1|t2, unit clause t3
 * @endcode
 */
enum class CNFMode {
    TSEITIN,         ///< Auxiliary variables for sub-formulas
    STRAIGHTFORWARD  ///< Feature variables only
};

#endif // CNFMODE_H
