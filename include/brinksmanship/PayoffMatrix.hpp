#pragma once

#include "brinksmanship/BasicTypes.hpp"
#include "brinksmanship/StateDeltas.hpp"

#include <array>
#include <string>

namespace brinksmanship {

/*
 * An immutable 2x2 matrix. Row 0 is player A's cooperative choice, row 1 competitive; columns
 * likewise for player B.
 */
class PayoffMatrix {
 public:
  using labels_t = std::array<std::string, 2>;

  PayoffMatrix(MatrixType matrix_type, const OutcomePayoffs& cc, const OutcomePayoffs& cd,
               const OutcomePayoffs& dc, const OutcomePayoffs& dd, const labels_t& row_labels,
               const labels_t& col_labels);

  MatrixType matrix_type() const { return matrix_type_; }

  // Throws std::out_of_range unless row and col are each 0 or 1.
  const OutcomePayoffs& outcome(int row, int col) const;

  const OutcomePayoffs& cc() const { return cells_[0][0]; }
  const OutcomePayoffs& cd() const { return cells_[0][1]; }
  const OutcomePayoffs& dc() const { return cells_[1][0]; }
  const OutcomePayoffs& dd() const { return cells_[1][1]; }

  const labels_t& row_labels() const { return row_labels_; }
  const labels_t& col_labels() const { return col_labels_; }

 private:
  MatrixType matrix_type_;
  OutcomePayoffs cells_[2][2];
  labels_t row_labels_;
  labels_t col_labels_;
};

}  // namespace brinksmanship

#include "inline/brinksmanship/PayoffMatrix.inl"
