#pragma once
#include <array>
#include <vector>

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
};

struct BoardLayout {
  std::array<Rect, 3> columns; // indexed by Status
  Rect log;
  Rect status;
};

std::vector<Rect> split_vertical(const Rect& area, int parts);
Rect split_bottom(Rect& area, int height);
BoardLayout compute_layout(const Rect& screen, int log_rows);
