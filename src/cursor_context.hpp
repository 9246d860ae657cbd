#pragma once
/*
 * CursorContext
 *
 * Purpose: the four collaborators a cursor needs to validate and convert its
 * state. Built by the session for each operation and passed by reference;
 * cursors never keep one, the document behind it may be swapped.
 */
#include "cursor_config.hpp"
#include "i_coordinates_converter.hpp"
#include "i_cursor_simple_model.hpp"
#include "i_text_model.hpp"

struct CursorContext {
  ITextModel& model;
  const ICursorSimpleModel& view_model;
  const ICoordinatesConverter& coordinates_converter;
  const CursorConfiguration& cursor_config;
};
