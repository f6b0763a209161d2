#include "brinksmanship/PayoffMatrix.hpp"

#include <format>
#include <stdexcept>

namespace brinksmanship {

inline PayoffMatrix::PayoffMatrix(MatrixType matrix_type, const OutcomePayoffs& cc,
                                  const OutcomePayoffs& cd, const OutcomePayoffs& dc,
                                  const OutcomePayoffs& dd, const labels_t& row_labels,
                                  const labels_t& col_labels)
    : matrix_type_(matrix_type),
      cells_{{cc, cd}, {dc, dd}},
      row_labels_(row_labels),
      col_labels_(col_labels) {}

inline const OutcomePayoffs& PayoffMatrix::outcome(int row, int col) const {
  if (row < 0 || row > 1 || col < 0 || col > 1) {
    throw std::out_of_range(std::format("PayoffMatrix::outcome({}, {})", row, col));
  }
  return cells_[row][col];
}

}  // namespace brinksmanship
