/*

mailbox.hpp
-----------

In-memory, ordered collection of messages. Reading and writing the stored
texts is left to the caller.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <postino/detail/log.hpp>
#include <postino/detail/result.hpp>
#include <postino/mime/message.hpp>

namespace postino::storage
{

enum class order_t {DATE, SENDER, RECIPIENTS, SUBJECT};

class mailbox
{
public:
    using const_iterator = std::vector<message>::const_iterator;

    explicit mailbox(std::string name) : name_(std::move(name)) {}

    // Texts that do not parse are skipped; the rest is listed newest first.
    static mailbox load(std::string name, const std::vector<std::string>& raw_texts,
                        message_parse_options_t options = message_parse_options_t{})
    {
        mailbox box(std::move(name));
        for (std::size_t i = 0; i < raw_texts.size(); ++i)
        {
            auto msg = message::parse(raw_texts[i], options);
            if (!msg)
            {
                POSTINO_WARN("mailbox `" + box.name_ + "`: entry " + std::to_string(i) + " skipped, " + msg.error().to_string());
                continue;
            }
            box.messages_.push_back(std::move(*msg));
        }
        box.sort(order_t::DATE, true);
        return box;
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::size_t size() const noexcept { return messages_.size(); }
    [[nodiscard]] bool empty() const noexcept { return messages_.empty(); }

    const_iterator begin() const noexcept { return messages_.begin(); }
    const_iterator end() const noexcept { return messages_.end(); }

    void add(message msg)
    {
        messages_.push_back(std::move(msg));
        sort(order_t::DATE, true);
    }

    void sort(order_t order, bool descending)
    {
        auto compare = [order](const message& lhs, const message& rhs)
        {
            switch (order)
            {
                case order_t::DATE: return lhs.headers().date < rhs.headers().date;
                case order_t::SENDER: return lhs.headers().from < rhs.headers().from;
                case order_t::RECIPIENTS: return lhs.headers().to < rhs.headers().to;
                case order_t::SUBJECT: return lhs.headers().subject < rhs.headers().subject;
            }
            return false;
        };

        if (descending)
            std::stable_sort(messages_.begin(), messages_.end(), [&compare](const message& lhs, const message& rhs) { return compare(rhs, lhs); });
        else
            std::stable_sort(messages_.begin(), messages_.end(), compare);
    }

    [[nodiscard]] result<message> read(std::size_t index) const
    {
        if (index >= messages_.size())
            return fail<message>(error_code::index_out_of_range, out_of_range(index));
        return messages_[index];
    }

    result_void remove(std::size_t index)
    {
        if (index >= messages_.size())
            return fail(error_code::index_out_of_range, out_of_range(index));
        messages_.erase(messages_.begin() + static_cast<std::ptrdiff_t>(index));
        return ok();
    }

private:
    std::string out_of_range(std::size_t index) const
    {
        return "Index " + std::to_string(index) + " out of range for mailbox `" + name_ + "` of " + std::to_string(messages_.size()) + " messages.";
    }

    std::string name_;
    std::vector<message> messages_;
};

} // namespace postino::storage
