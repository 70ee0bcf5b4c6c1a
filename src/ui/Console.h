#pragma once

#include "chat/EventStream.h"

#include <ostream>
#include <string>

namespace lanchat::ui {

// Terminal presentation of client events. Only this layer knows about colors.
class Console {
public:
    Console(std::ostream& out, bool color);

    // One line per event, without the trailing newline.
    std::string render(const chat::ClientEvent& event) const;

    void print(const chat::ClientEvent& event);
    void print_error(const std::string& text);

    // Prints events until the stream ends.
    void drain(chat::EventStream& events);

private:
    std::string paint(const char* color, const std::string& text) const;

    std::ostream& out_;
    bool color_;
};

} // namespace lanchat::ui
