#include "tellcore/core/asio_callback_dispatcher.h"

#include <boost/asio/post.hpp>

#include <memory>

namespace tellcore {
namespace core {

AsioCallbackDispatcher::AsioCallbackDispatcher(boost::asio::io_context& context)
    : context_(context) {}

void AsioCallbackDispatcher::onCallback(PendingEvent event) {
    auto shared = std::make_shared<PendingEvent>(std::move(event));
    boost::asio::post(context_, [shared] { deliver(*shared); });
}

} // namespace core
} // namespace tellcore
