#pragma once
/*
 * CursorColumns
 *
 * Purpose: convert between byte columns and visible columns (tabs expand to
 * the next tab stop) and compute indentation tab stops.
 * Note: visible columns are 0-based, byte columns 1-based.
 */
#include <string>

int next_render_tab_stop(int visible_column, int tab_size);
int next_indent_tab_stop(int visible_column, int indent_size);
int prev_render_tab_stop(int visible_column, int tab_size);
int prev_indent_tab_stop(int visible_column, int indent_size);

int visible_column_from_column(const std::string& line, int column, int tab_size);
int column_from_visible_column(const std::string& line, int visible_column, int tab_size);
