#pragma once

#include "tellcore/core/callback_dispatcher.h"

#include <boost/asio/io_context.hpp>

namespace tellcore {
namespace core {

/**
 * @brief Posts native events onto a Boost.Asio io_context
 *
 * Callbacks run on whichever thread runs the io_context. The io_context must
 * outlive the dispatcher.
 */
class AsioCallbackDispatcher : public CallbackDispatcher {
public:
    explicit AsioCallbackDispatcher(boost::asio::io_context& context);

    void onCallback(PendingEvent event) override;

    boost::asio::io_context& context() { return context_; }

private:
    boost::asio::io_context& context_;
};

} // namespace core
} // namespace tellcore
