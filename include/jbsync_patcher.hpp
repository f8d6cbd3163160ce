// jbsync_patcher.hpp - JBeam Sync - Leaf Value Patcher
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JBSYNC_PATCHER_HPP
#define JBSYNC_PATCHER_HPP

#include "jbsync_value.hpp"
#include "jbsync_log.hpp"

#include <optional>

namespace jbsync
{
//========================================================================
// Structural path walker
//========================================================================

    enum class path_event
    {
        none,       // whitespace or comment
        open,
        close,
        key,
        colon,
        scalar
    };

    // Rebuilds the key/index stack of a token document one token at a
    // time. The outermost container is not a frame; a value directly in
    // it has an empty frame stack.
    class structural_path
    {
    public:
        path_event step(token const & t);

        std::span<path_frame const> frames() const noexcept { return frames_; }
        size_t depth() const noexcept { return frames_.size(); }
        bool in_object() const noexcept { return in_object_; }

        // Slot of the last scalar, or of the container just opened
        path_key const & slot() const noexcept { return slot_; }

        // Frame removed by the last close; nullopt when the outermost
        // container closed
        std::optional<path_frame> const & popped() const noexcept { return popped_; }

    private:
        std::vector<path_frame> frames_;
        bool in_object_ {true};
        bool root_open_ {false};
        size_t array_pos_ {0};
        std::optional<std::string> key_;
        bool colon_seen_ {false};
        path_key slot_ {size_t{0}};
        std::optional<path_frame> popped_;

        void reset_cursor(bool object)
        {
            in_object_ = object;
            array_pos_ = 0;
            key_.reset();
            colon_seen_ = false;
        }
    };

//---------------------------------------------------------------------------

    inline path_event structural_path::step(token const & t)
    {
        switch (t.kind)
        {
            case token_kind::wsc:
                return path_event::none;

            case token_kind::object_open:
            case token_kind::array_open:
            {
                bool object = t.kind == token_kind::object_open;

                if (!root_open_ && frames_.empty())
                {
                    root_open_ = true;
                    reset_cursor(object);
                    return path_event::open;
                }

                if (in_object_)
                {
                    slot_ = key_.value_or(std::string{});
                    frames_.push_back({ slot_, true });
                }
                else
                {
                    slot_ = array_pos_;
                    frames_.push_back({ slot_, false });
                }
                reset_cursor(object);
                return path_event::open;
            }

            case token_kind::object_close:
            case token_kind::array_close:
            {
                if (frames_.empty())
                {
                    popped_.reset();
                    root_open_ = false;
                    reset_cursor(true);
                    return path_event::close;
                }

                popped_ = frames_.back();
                frames_.pop_back();
                reset_cursor(popped_->parent_is_object);
                if (!in_object_)
                    array_pos_ = std::get<size_t>(popped_->key) + 1;
                return path_event::close;
            }

            case token_kind::colon:
                colon_seen_ = true;
                return path_event::colon;

            default:
                break;
        }

        // Scalars
        if (in_object_)
        {
            if (!colon_seen_)
            {
                key_ = decode_string(t.text);
                return path_event::key;
            }
            slot_ = key_.value_or(std::string{});
            key_.reset();
            colon_seen_ = false;
            return path_event::scalar;
        }

        slot_ = array_pos_++;
        return path_event::scalar;
    }

//========================================================================
// Leaf patching
//========================================================================

    // Values below a part's "slots" section are never patched
    inline bool is_slots_path(std::span<path_frame const> frames)
    {
        if (frames.size() < 2) return false;
        auto key = std::get_if<std::string>(&frames[1].key);
        return key && *key == "slots";
    }

    namespace detail
    {
        inline void set_number(token & t, double v)
        {
            auto nt = format_number(v);
            t.text = std::move(nt.text);
            t.precision = nt.precision;
        }

        inline std::optional<std::string> literal_text(value const & v)
        {
            if (auto b = v.as_bool()) return *b ? "true" : "false";
            if (v.is_null()) return "null";
            return std::nullopt;
        }

        // Writes `now` into the token when it differs from `before` (or
        // from the token itself when there is no baseline value). Token
        // kinds never change.
        inline bool install(token & t, value const & now, value const * before)
        {
            switch (t.kind)
            {
                case token_kind::number:
                {
                    auto n = now.as_number();
                    if (!n) return false;

                    if (before)
                    {
                        auto b = before->as_number();
                        if (b && same_float(*b, *n)) return false;
                        if (!b && *before == now) return false;
                    }
                    else if (same_float(std::strtod(t.text.c_str(), nullptr), *n))
                        return false;

                    set_number(t, *n);
                    return true;
                }
                case token_kind::string:
                {
                    auto s = now.as_string();
                    if (!s) return false;
                    if (before ? *before == now : decode_string(t.text) == *s) return false;

                    t.text = encode_string(*s);
                    return true;
                }
                case token_kind::literal:
                {
                    auto lit = literal_text(now);
                    if (!lit) return false;
                    if (before ? *before == now : t.text == *lit) return false;

                    t.text = *lit;
                    return true;
                }
                default:
                    return false;
            }
        }
    }

//---------------------------------------------------------------------------

    // Patches one scalar token from the current tree. Returns true when the
    // token text changed. Never alters the document length.
    inline bool patch_leaf(
        value const & baseline,
        value const & current,
        std::span<path_frame const> frames,
        path_key const & slot,
        token & t )
    {
        auto now = resolve(current, frames, slot);
        if (now.status != resolve_status::found)
        {
#ifndef NDEBUG
            if (now.status == resolve_status::mismatch)
                log::debug("structural mismatch at {}; value left unchanged", describe(frames, slot));
#endif
            return false;
        }

        auto before = resolve(baseline, frames, slot);
#ifndef NDEBUG
        if (before.status == resolve_status::mismatch)
            log::debug("baseline mismatch at {}; treating as new value", describe(frames, slot));
#endif

        return detail::install(t, *now.target,
            before.status == resolve_status::found ? before.target : nullptr);
    }

//---------------------------------------------------------------------------

    // Scalar-only diff of a whole document. Returns the number of tokens
    // rewritten.
    inline size_t patch_values(document & doc, value const & baseline, value const & current)
    {
        structural_path path;
        size_t changed = 0;

        for (auto & t : doc)
        {
            if (path.step(t) != path_event::scalar)
                continue;
            if (is_slots_path(path.frames()))
                continue;
            if (patch_leaf(baseline, current, path.frames(), path.slot(), t))
                ++changed;
        }
        return changed;
    }

} // namespace jbsync

#endif
