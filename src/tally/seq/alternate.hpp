//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_SEQ_ALTERNATE_HPP
#define TALLY_SEQ_ALTERNATE_HPP

#include <tally/config.hpp>
//
#include <tally/seq/requirements.hpp>

#include <tally/logging.hpp>
#include <tally/optional.hpp>
#include <tally/utility.hpp>

#include <ostream>
#include <type_traits>

namespace tally {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// alternate
//
enum struct AlternateTurn {
    kFirst,
    kSecond,
};

inline std::ostream& operator<<(std::ostream& out, AlternateTurn t)
{
    switch (t) {
    case AlternateTurn::kFirst:
        return out << "First";
    case AlternateTurn::kSecond:
        return out << "Second";
    }
    return out << "(bad AlternateTurn)";
}

/// Yields one item from `first`, then one from `second`, then one from `first`, and so on.  The first
/// time the source whose turn it is comes up empty, the Alternate is finished: it returns None from then
/// on and never pulls either source again, even if the other one still has items.
///
/// Resulting length is `2*min(k, j)` if `first` (length k) runs dry no later than `second` (length j),
/// otherwise `2*j + 1`.
///
template <typename FirstSeq, typename SecondSeq>
class Alternate
{
   public:
    // Same rule as MergeBy: identical item types (including borrowed references) pass through as-is;
    // otherwise the items are converted to their common (decayed) type.
    //
    using Item = std::conditional_t<
        /* if */ std::is_same_v<SeqItem<FirstSeq>, SeqItem<SecondSeq>>,
        /* then */ SeqItem<FirstSeq>,
        /* else */ std::common_type_t<SeqItem<FirstSeq>, SeqItem<SecondSeq>>>;

    explicit Alternate(FirstSeq&& first, SecondSeq&& second) noexcept
        : first_(TALLY_FORWARD(first))
        , second_(TALLY_FORWARD(second))
    {
    }

    AlternateTurn turn() const
    {
        return this->turn_;
    }

    bool is_finished() const
    {
        return this->finished_;
    }

    // Forwards to the current-turn source's `peek()` without changing turn or finished state.  A source
    // that tests items as it looks ahead (e.g. one that skips items failing a predicate) will test the
    // peeked item again when the following `next()` pulls it.
    //
    Optional<Item> peek()
    {
        if (this->finished_) {
            return None;
        }
        if (this->turn_ == AlternateTurn::kFirst) {
            return to_item(this->first_.peek());
        }
        return to_item(this->second_.peek());
    }

    Optional<Item> next()
    {
        if (this->finished_) {
            return None;
        }

        const AlternateTurn pulled_from = this->turn_;
        Optional<Item> item = (pulled_from == AlternateTurn::kFirst) ? to_item(this->first_.next())
                                                                     : to_item(this->second_.next());

        this->turn_ = (pulled_from == AlternateTurn::kFirst) ? AlternateTurn::kSecond : AlternateTurn::kFirst;

        if (!item) {
            TALLY_VLOG(1) << "(seq::alternate) " << pulled_from << " sequence ran dry; finished";
            this->finished_ = true;
        }
        return item;
    }

   private:
    template <typename T>
    static Optional<Item> to_item(Optional<T>&& src)
    {
        if constexpr (std::is_same_v<T, Item>) {
            return std::move(src);
        } else {
            if (!src) {
                return None;
            }
            return Optional<Item>{Item(*src)};
        }
    }

    FirstSeq first_;
    SecondSeq second_;
    AlternateTurn turn_ = AlternateTurn::kFirst;
    bool finished_ = false;
};

template <typename FirstSeq, typename SecondSeq>
[[nodiscard]] Alternate<FirstSeq, SecondSeq> alternate(FirstSeq&& first, SecondSeq&& second)
{
    static_assert(std::is_same_v<FirstSeq, std::decay_t<FirstSeq>>,
                  "(seq::alternate) Sequences may not be captured implicitly by reference.");

    static_assert(std::is_same_v<SecondSeq, std::decay_t<SecondSeq>>,
                  "(seq::alternate) Sequences may not be captured implicitly by reference.");

    static_assert(is_seq_v<FirstSeq> && is_seq_v<SecondSeq>,
                  "(seq::alternate) Both arguments must be sequences.");

    return Alternate<FirstSeq, SecondSeq>{TALLY_FORWARD(first), TALLY_FORWARD(second)};
}

template <typename SecondSeq>
struct AlternateBinder {
    SecondSeq second;
};

template <typename SecondSeq>
AlternateBinder<SecondSeq> alternate(SecondSeq&& second)
{
    return {TALLY_FORWARD(second)};
}

template <typename FirstSeq, typename SecondSeq, typename = EnableIfSeq<FirstSeq>>
[[nodiscard]] Alternate<FirstSeq, SecondSeq> operator|(FirstSeq&& first, AlternateBinder<SecondSeq>&& binder)
{
    return alternate(TALLY_FORWARD(first), TALLY_FORWARD(binder.second));
}

}  // namespace seq
}  // namespace tally

#endif  // TALLY_SEQ_ALTERNATE_HPP
