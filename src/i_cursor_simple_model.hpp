#pragma once
/*
 * ICursorSimpleModel
 *
 * Purpose: the minimal line accessor cursor algorithms read from
 * (document or view), nothing that mutates.
 */
#include <string>
#include "types.hpp"

enum class PositionAffinity { Left, Right, None };

class ICursorSimpleModel {
public:
  virtual ~ICursorSimpleModel() = default;
  virtual int get_line_count() const = 0;
  virtual std::string get_line_content(int line) const = 0;
  virtual int get_line_min_column(int line) const = 0;
  virtual int get_line_max_column(int line) const = 0;
  virtual Position normalize_position(const Position& position, PositionAffinity affinity) const = 0;
};
