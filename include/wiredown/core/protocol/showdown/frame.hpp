#pragma once

#include <string_view>
#include <iterator>
#include <cstddef>


namespace wiredown::core::protocol::showdown {

// One protocol line and the room it belongs to. Views into the frame text.
struct RoomLine {
    std::string_view room;
    std::string_view line;

    bool operator==(const RoomLine&) const = default;
};

/*
===============================================================================
 Frame demultiplexer
===============================================================================

A server frame is a newline separated batch of lines. A line starting with '>'
switches the current room for the lines that follow it in the same frame; the
current room starts as "" (global) at the top of every frame.

  >battle-gen9ou-1
  |turn|3
  |request|{...}

Frame is a lazy, restartable range over the (room, line) pairs of one frame:
  - empty lines are skipped
  - room header lines switch the room and are not themselves yielded
  - begin() always restarts from the top of the frame

Frame never copies: the frame text must outlive the range and its iterators.
===============================================================================
*/
class Frame {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = RoomLine;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const RoomLine*;
        using reference         = const RoomLine&;

        // End sentinel
        iterator() = default;

        explicit iterator(std::string_view raw) noexcept
            : raw_(raw)
            , at_end_(false)
        {
            advance_();
        }

        reference operator*() const noexcept { return current_; }
        pointer operator->() const noexcept { return &current_; }

        iterator& operator++() noexcept {
            advance_();
            return *this;
        }

        iterator operator++(int) noexcept {
            iterator tmp = *this;
            advance_();
            return tmp;
        }

        friend bool operator==(const iterator& a, const iterator& b) noexcept {
            return a.at_end_ == b.at_end_ && (a.at_end_ || a.pos_ == b.pos_);
        }

    private:
        std::string_view raw_;
        std::size_t pos_{0};          // start of the next unread line
        std::string_view room_;
        RoomLine current_;
        bool at_end_{true};

        inline void advance_() noexcept {
            while (pos_ < raw_.size()) {
                const std::size_t nl = raw_.find('\n', pos_);
                const std::size_t end = (nl == std::string_view::npos) ? raw_.size() : nl;
                const std::string_view line = raw_.substr(pos_, end - pos_);
                pos_ = (nl == std::string_view::npos) ? raw_.size() : nl + 1;
                if (line.empty()) {
                    continue;
                }
                if (line.front() == '>') {
                    room_ = line.substr(1);
                    continue;
                }
                current_ = RoomLine{room_, line};
                return;
            }
            at_end_ = true;
            current_ = RoomLine{};
        }
    };

    explicit Frame(std::string_view raw) noexcept
        : raw_(raw)
    {}

    [[nodiscard]] iterator begin() const noexcept { return iterator{raw_}; }
    [[nodiscard]] iterator end() const noexcept { return iterator{}; }

    [[nodiscard]] std::string_view raw() const noexcept { return raw_; }

private:
    std::string_view raw_;
};

[[nodiscard]]
inline Frame demux(std::string_view raw) noexcept {
    return Frame{raw};
}

} // namespace wiredown::core::protocol::showdown
