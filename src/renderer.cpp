#include "renderer.hpp"
#include <algorithm>
#include <initializer_list>
#include <sstream>
#include "config.hpp"

static std::string clip(const std::string& s, int width) {
  if (width <= 0) return std::string();
  if ((int)s.size() <= width) return s;
  return s.substr(0, width);
}

static void draw_frame(ITerminal& term, const Rect& area, const std::string& title, bool emphasized) {
  if (area.width < 2 || area.height < 2) return;
  int inner_w = area.width - 2;
  std::string top = "+" + clip(title, inner_w);
  top += std::string(area.width - 1 - (int)top.size(), '-') + "+";
  if (emphasized) term.draw_colored(area.row, area.col, top, PairActive);
  else term.draw_text(area.row, area.col, top);
  for (int r = 1; r < area.height - 1; ++r) {
    term.draw_text(area.row + r, area.col, "|");
    term.draw_text(area.row + r, area.col + area.width - 1, "|");
  }
  term.draw_text(area.row + area.height - 1, area.col, "+" + std::string(inner_w, '-') + "+");
}

static int severity_pair(Severity s) {
  switch (s) {
    case Severity::Info: return PairDefault;
    case Severity::Warning: return PairWarning;
    case Severity::Error:
    case Severity::Critical: return PairError;
  }
  return PairDefault;
}

const char* Renderer::highlight_symbol(Status s) {
  return s == Status::InProgress ? "&& " : ">> ";
}

int Renderer::first_visible(const std::vector<const Item*>& items, int highlighted, int height, int top_item) {
  int n = static_cast<int>(items.size());
  int start = std::clamp(top_item, 0, std::max(0, n - 1));
  if (highlighted < 0 || highlighted >= n) return start;
  if (highlighted < start) return highlighted;
  auto rows = [&](int from, int to) {
    int r = 0;
    for (int i = from; i <= to; ++i) r += 1 + std::max(0, items[i]->weight);
    return r;
  };
  // scroll down only as far as needed to show the highlighted item's last row
  while (start < highlighted && rows(start, highlighted) > height) start++;
  return start;
}

void Renderer::render(ITerminal& term,
                      const Board& board,
                      const LogQueue& logs,
                      ColumnViewports& vps,
                      const std::string& message,
                      const std::string& hints) {
  TermSize sz = term.get_size();
  term.clear();
  BoardLayout layout = compute_layout(Rect{0, 0, sz.rows, sz.cols}, KB_LOG_ROWS);
  for (Status s : {Status::ToDo, Status::UpNext, Status::InProgress}) {
    int idx = static_cast<int>(s);
    render_column(term, layout.columns[idx], s, board, vps[idx]);
  }
  render_log(term, layout.log, logs);
  render_status(term, layout.status, board, message, hints);
  term.move_cursor(std::max(0, sz.rows - 1), 0);
  term.refresh();
}

void Renderer::render_column(ITerminal& term, const Rect& area, Status s, const Board& board, ColumnViewport& vp) {
  draw_frame(term, area, status_name(s), board.active_column() == s);
  int inner_h = area.height - 2;
  int inner_w = area.width - 2;
  if (inner_h <= 0 || inner_w <= 0) return;

  auto items = board.column(s);
  auto sel = board.selected();
  int hi = (sel && *sel < items.size()) ? static_cast<int>(*sel) : -1;
  std::string symbol = highlight_symbol(s);
  std::string pad = sel ? std::string(symbol.size(), ' ') : std::string();

  int row = area.row + 1;
  int col = area.col + 1;
  int bottom = area.row + 1 + inner_h;
  vp.top_item = first_visible(items, hi, inner_h, vp.top_item);
  for (int i = vp.top_item; i < (int)items.size() && row < bottom; ++i) {
    const Item& it = *items[i];
    bool highlighted = (i == hi);
    for (int k = 0; k <= std::max(0, it.weight) && row < bottom; ++k, ++row) {
      std::string text = (k == 0) ? it.label : std::string(KB_DETAIL_TEXT);
      text = clip((highlighted && k == 0 ? symbol : pad) + text, inner_w);
      if (highlighted) {
        text += std::string(inner_w - (int)text.size(), ' ');
        term.draw_highlighted(row, col, text, 0, (int)text.size());
      } else {
        term.draw_text(row, col, text);
      }
    }
  }
}

void Renderer::render_log(ITerminal& term, const Rect& area, const LogQueue& logs) {
  draw_frame(term, area, "Log", false);
  int inner_h = area.height - 2;
  int inner_w = area.width - 2;
  if (inner_h <= 0 || inner_w <= 0) return;
  int row = area.row + 1;
  for (const auto& e : logs.entries()) {
    if (row >= area.row + 1 + inner_h) break;
    std::string tag = std::string("[") + severity_name(e.severity) + "]";
    std::string tag_vis = clip(tag, inner_w);
    term.draw_colored(row, area.col + 1, tag_vis, severity_pair(e.severity));
    int rest_w = inner_w - (int)tag_vis.size();
    if (rest_w > 0) term.draw_text(row, area.col + 1 + (int)tag_vis.size(), clip(" " + e.label, rest_w));
    ++row;
  }
}

void Renderer::render_status(ITerminal& term, const Rect& area, const Board& board,
                             const std::string& message, const std::string& hints) {
  if (area.height <= 0 || area.width <= 0) return;
  std::ostringstream oss;
  oss << status_name(board.active_column()) << "  ";
  if (auto sel = board.selected()) oss << "sel:" << (*sel + 1) << "/" << board.size();
  else oss << "sel:-/" << board.size();
  oss << "  " << status_name(Status::ToDo) << ":" << board.count(Status::ToDo)
      << " " << status_name(Status::UpNext) << ":" << board.count(Status::UpNext)
      << " " << status_name(Status::InProgress) << ":" << board.count(Status::InProgress);
  if (!message.empty()) oss << "  | " << message;
  if (!hints.empty()) oss << "  | " << hints;
  std::string status = clip(oss.str(), area.width);
  term.draw_text(area.row, area.col, status);
  term.clear_to_eol(area.row, area.col + (int)status.size());
}
