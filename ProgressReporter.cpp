#include "ProgressReporter.hpp"

#include <cstdio>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>
#include <ftxui/screen/terminal.hpp>
#include <print>

#include "IOManager.hpp"
#include "utils.hpp"

using namespace ftxui;

TerminalProgress::~TerminalProgress() { finish(); }

void TerminalProgress::start(std::size_t total) {
  {
    std::scoped_lock lock(m_mutex);
    m_total = total;
    m_done = 0;
    m_current.clear();
    m_active = true;
  }

  IOManager::set_log_handler([this](std::string_view message) {
    std::scoped_lock lock(m_mutex);
    clear_line();
    std::println(stderr, "{}", message);
    redraw();
  });

  std::scoped_lock lock(m_mutex);
  redraw();
}

void TerminalProgress::advance(const fs::path& item) {
  std::scoped_lock lock(m_mutex);
  if (!m_active) return;
  ++m_done;
  m_current = safe_path_to_string(item.filename());
  redraw();
}

void TerminalProgress::finish() {
  {
    std::scoped_lock lock(m_mutex);
    if (!m_active) return;
    m_active = false;
    redraw();
    std::print(stderr, "\n");
    std::fflush(stderr);
  }
  IOManager::set_log_handler(nullptr);
}

void TerminalProgress::clear_line() {
  if (!m_active) return;
  std::print(stderr, "\r\x1b[2K");
}

void TerminalProgress::redraw() {
  const float ratio =
      m_total == 0 ? 1.0f
                   : static_cast<float>(m_done) / static_cast<float>(m_total);
  const std::string counter = std::format(" [{}/{}] ", m_done, m_total);

  Element bar = hbox({
      text("Organizing ") | bold,
      gauge(ratio) | flex | color(Color::Green),
      text(counter),
      text(m_current) | dim | size(WIDTH, LESS_THAN, 40),
  });

  int width = Terminal::Size().dimx;
  if (width <= 0) width = 80;
  auto screen = Screen::Create(Dimension::Fixed(width), Dimension::Fixed(1));
  Render(screen, bar);
  std::print(stderr, "\r{}", screen.ToString());
  std::fflush(stderr);
}
