#pragma once

#include "../screen_layout.hpp"
#include "../session.hpp"
#include <chrono>
#include <string>
#include <vector>
#include <ncurses.h>

namespace svcdeck {

class TuiApp {
public:
    // Non-owning: the session must outlive the TuiApp instance.
    explicit TuiApp(Session* session);
    ~TuiApp();

    void run();

private:
    using Clock = std::chrono::steady_clock;

    // Rendering
    void render(Clock::time_point now);
    void render_header();
    void render_unit_list();
    void render_log_panel();
    void render_status_bar(Clock::time_point now);
    void render_picker();
    void render_confirm_dialog(Clock::time_point now);
    void render_text_modal(const std::string& title, const std::vector<std::string>& lines,
                           size_t scroll, bool is_error);
    void render_help_overlay();

    // Input handling
    void handle_input(int ch);
    void handle_unit_list_input(int ch);
    void handle_log_panel_input(int ch);
    void handle_typing_input(int ch);
    void handle_picker_input(int ch);
    void handle_confirm_input(int ch);
    void handle_modal_input(int ch);
    void handle_mouse_event();

    // Window management
    void create_windows();
    void resize_windows();
    void cleanup_windows();
    void scroll_to_selection();

    // Utility
    void draw_box_title(WINDOW* win, const std::string& title);
    WINDOW* make_dialog(int height, int width, const std::string& title);

    // Non-owned session state
    Session* session_ = nullptr;

    // ncurses windows
    WINDOW* header_win_ = nullptr;
    WINDOW* unit_win_ = nullptr;
    WINDOW* log_win_ = nullptr;
    WINDOW* status_win_ = nullptr;

    // Layout the windows were created for
    bool layout_log_focus_ = false;
    ScreenLayout layout_;
    int unit_win_y_ = 0;
    int unit_win_height_ = 0;
    int unit_win_width_ = 0;

    // Scroll positions
    int unit_scroll_offset_ = 0;
    int visible_unit_rows_ = 0;

    static constexpr int kMouseScrollStep = 3;
};

} // namespace svcdeck
