#include "widgets.hpp"
#include "definitions.hpp"  // for INSTALLER_TITLE

#include "cryptlvm/string_utils.hpp"  // for make_multiline

#include <algorithm>  // for transform
#include <iterator>   // for back_insert_iterator
#include <memory>     // for shared_ptr
#include <string>     // for string
#include <utility>    // for move

#include <ftxui/component/captured_mouse.hpp>      // for ftxui
#include <ftxui/component/component.hpp>           // for Renderer, Vertical
#include <ftxui/component/component_base.hpp>      // for ComponentBase
#include <ftxui/component/component_options.hpp>   // for ButtonOption, InputOption
#include <ftxui/component/screen_interactive.hpp>  // for ScreenInteractive
#include <ftxui/dom/elements.hpp>                  // for operator|, Element
#include <ftxui/util/ref.hpp>                      // for Ref

using namespace ftxui;

namespace tui::detail {

namespace {

auto separator_line() noexcept -> Component {
    return Renderer([] { return separator(); });
}

// OK/Cancel style button row, centered under the dialog content
auto button_row(std::string_view ok_label, std::string_view cancel_label, std::function<void()> on_ok, std::function<void()> on_cancel) noexcept -> Component {
    auto buttons = controls_widget({ok_label, cancel_label}, {std::move(on_ok), std::move(on_cancel)});
    return Renderer(buttons, [buttons] {
        return buttons->Render() | hcenter | size(HEIGHT, LESS_THAN, 3) | size(WIDTH, GREATER_THAN, 25);
    });
}

// Stacks the children vertically inside of a titled frame and runs it
void run_dialog(ScreenInteractive& screen, Components children) noexcept {
    auto global   = Container::Vertical(std::move(children));
    auto renderer = Renderer(global, [&] {
        return centered_interative_multi(INSTALLER_TITLE, global);
    });
    screen.Loop(renderer);
}

auto text_block(std::string_view content, Decorator boxsize) noexcept -> Component {
    return Renderer([lines = cryptlvm::utils::make_multiline(content), boxsize] {
        return multiline_text(lines) | hcenter | boxsize;
    });
}

}  // namespace

Element centered_widget(Component& container, const std::string_view& title, const Element& widget) noexcept {
    return vbox({
        text(title.data()) | bold,
        filler(),
        hbox({
            filler(),
            border(vbox({
                widget,
                separator(),
                container->Render() | hcenter | size(HEIGHT, LESS_THAN, 3) | size(WIDTH, GREATER_THAN, 25),
            })),
            filler(),
        }) | center,
        filler(),
    });
}

Component controls_widget(const std::array<std::string_view, 2>&& titles, const std::array<std::function<void()>, 2>&& callbacks) noexcept {
    return Container::Horizontal({
        Button(titles[0].data(), callbacks[0], ButtonOption::WithoutBorder()),
        Renderer([] { return filler() | size(WIDTH, GREATER_THAN, 3); }),
        Button(titles[1].data(), callbacks[1], ButtonOption::WithoutBorder()),
    });
}

Element centered_interative_multi(const std::string_view& title, Component& widgets) noexcept {
    return vbox({
        text(title.data()) | bold,
        filler(),
        hbox({filler(), border(widgets->Render()), filler()}) | center,
        filler(),
    });
}

Element multiline_text(const std::vector<std::string>& lines) noexcept {
    Elements multiline;

    std::transform(lines.cbegin(), lines.cend(), std::back_inserter(multiline),
        [](const std::string& line) -> Element { return text(line); });
    return vbox(std::move(multiline)) | frame;
}

void msgbox_widget(const std::string_view& content, Decorator boxsize) noexcept {
    auto screen    = ScreenInteractive::Fullscreen();
    auto container = Container::Horizontal({Button("OK", screen.ExitLoopClosure(), ButtonOption::WithoutBorder())});
    auto renderer  = Renderer(container, [&] {
        return centered_widget(container, INSTALLER_TITLE, multiline_text(cryptlvm::utils::make_multiline(content)) | boxsize);
    });

    screen.Loop(renderer);
}

bool inputbox_widget(std::string& value, const std::string_view& content, Decorator boxsize, bool password) noexcept {
    auto screen = ScreenInteractive::Fullscreen();
    bool accepted{};
    auto on_ok = [&] {
        accepted = true;
        screen.ExitLoopClosure()();
    };

    InputOption input_option{.on_enter = on_ok, .password = password};
    run_dialog(screen, {
        text_block(content, std::move(boxsize)),
        separator_line(),
        Input(&value, "", input_option),
        separator_line(),
        button_row("OK", "Cancel", on_ok, screen.ExitLoopClosure()),
    });
    return accepted;
}

bool yesno_widget(const std::string_view& content, Decorator boxsize) noexcept {
    auto screen = ScreenInteractive::Fullscreen();
    bool accepted{};
    auto on_yes = [&] {
        accepted = true;
        screen.ExitLoopClosure()();
    };

    run_dialog(screen, {
        text_block(content, std::move(boxsize)),
        separator_line(),
        button_row("Yes", "No", on_yes, screen.ExitLoopClosure()),
    });
    return accepted;
}

void menu_widget(const std::vector<std::string>& entries, const std::function<void()>&& ok_callback, std::int32_t* selected, ScreenInteractive* screen, const std::string_view& text, const WidgetBoxSize widget_sizes) noexcept {
    MenuOption menu_option{.on_enter = ok_callback};
    auto menu    = Menu(&entries, selected, &menu_option);
    auto content = Renderer(menu, [&] {
        return menu->Render() | center | widget_sizes.content_size;
    });

    Components children{};
    if (!text.empty()) {
        children.push_back(text_block(text, widget_sizes.text_size));
        children.push_back(separator_line());
    }
    children.push_back(content);
    children.push_back(separator_line());
    children.push_back(button_row("OK", "Cancel", ok_callback, screen->ExitLoopClosure()));

    run_dialog(*screen, std::move(children));
}

}  // namespace tui::detail
