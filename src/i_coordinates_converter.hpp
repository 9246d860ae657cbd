#pragma once
/*
 * ICoordinatesConverter
 *
 * Purpose: maps between model (document) coordinates and view coordinates.
 * The validate_* calls keep a view candidate only if it still agrees with
 * the model value it is expected to represent.
 */
#include "types.hpp"

class ICoordinatesConverter {
public:
  virtual ~ICoordinatesConverter() = default;
  virtual Position convert_view_position_to_model_position(const Position& view_position) const = 0;
  virtual Range convert_view_range_to_model_range(const Range& view_range) const = 0;
  virtual Position convert_model_position_to_view_position(const Position& model_position) const = 0;
  virtual Range convert_model_range_to_view_range(const Range& model_range) const = 0;
  virtual Position validate_view_position(const Position& view_position, const Position& expected_model_position) const = 0;
  virtual Range validate_view_range(const Range& view_range, const Range& expected_model_range) const = 0;
};
