#pragma once

#include "brinksmanship/BasicTypes.hpp"
#include "brinksmanship/MatrixParameters.hpp"
#include "brinksmanship/PayoffMatrix.hpp"
#include "brinksmanship/StateDeltas.hpp"

#include <string>
#include <utility>
#include <vector>

/*
 * The closed registry of 2x2 game constructors.
 *
 * Every matrix in the game is produced by build(type, params). The set of matrix types is fixed;
 * dispatch is a switch over MatrixType, so adding a type means adding a case to validate() and
 * build(), and a default to default_params().
 */
namespace brinksmanship {

// All fourteen types, in declaration order.
const std::vector<MatrixType>& all_matrix_types();

// Shorthand tags accepted by parse_matrix_type(), paired with the type they resolve to.
const std::vector<std::pair<std::string, MatrixType>>& matrix_type_aliases();

/*
 * Resolves a tag from a scenario file. The tag is lowercased, '-' and ' ' are mapped to '_',
 * then aliases are applied. Throws UnknownTagError listing every valid tag and alias.
 */
MatrixType parse_matrix_type(const std::string& tag);

// The canonical tag, e.g. "prisoners_dilemma".
inline std::string matrix_type_tag(MatrixType type) { return enum_to_tag(type); }

// Canonical parameters for type. These always pass validate().
MatrixParameters default_params(MatrixType type);

// Throws ConstraintError if params violates the shared contract or the ordering type requires.
void validate(MatrixType type, const MatrixParameters& params);

// Validates, then builds the matrix.
PayoffMatrix build(MatrixType type, const MatrixParameters& params);

// Converts one raw (payoff_a, payoff_b, base_risk) cell into StateDeltas.
StateDeltas make_deltas(double payoff_a, double payoff_b, double base_risk,
                        const MatrixParameters& params);

}  // namespace brinksmanship
