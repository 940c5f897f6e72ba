#pragma once

#include <albumsync/progress/progress-types.hxx>

#include <mutex>
#include <string>
#include <ostream>

#include <ftxui/dom/elements.hpp>

namespace albumsync
{
  // Renderer traits for customization.
  //
  template <typename S = std::string>
  struct progress_renderer_traits
  {
    using string_type = S;

    // Width of the gauge in cells.
    //
    static constexpr int bar_width = 24;

    // Width used when the output is not a terminal we can query.
    //
    static constexpr int fallback_width = 100;

    // The status line for one album: label, gauge, percentage, counters,
    // throughput and ETA.
    //
    static ftxui::Element
    render_line (const string_type& label, const progress_snapshot&);
  };

  // Single-line progress display.
  //
  // Each render replaces the previous line in place. Nothing is drawn when
  // disabled (output is not a terminal, or --no-progress).
  //
  template <typename T = progress_renderer_traits<>>
  class basic_progress_renderer
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    explicit
    basic_progress_renderer (std::ostream&, bool enabled = true);

    basic_progress_renderer (const basic_progress_renderer&) = delete;
    basic_progress_renderer& operator= (const basic_progress_renderer&) = delete;

    void
    label (string_type);

    void
    render (const progress_snapshot&);

    // Move past the status line so that whatever follows starts on a fresh
    // one.
    //
    void
    finish ();

    bool
    enabled () const noexcept
    {
      return enabled_;
    }

    // Render to a string of the specified width (no cursor movement).
    //
    static std::string
    to_string (const string_type& label, const progress_snapshot&, int width);

  private:
    std::mutex mutex_;
    std::ostream& os_;
    bool enabled_;
    bool drawn_ = false;
    string_type label_;
    std::string reset_;
  };

  using progress_renderer = basic_progress_renderer<>;
}
