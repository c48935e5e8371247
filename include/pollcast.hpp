/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file pollcast.hpp
 * @brief pollcast - live poll server over a poll() WebSocket reactor
 *
 * Votes arrive over HTTP, are committed atomically by a Store, published
 * as ChangeEvents and fanned out to every WebSocket watching the poll.
 *
 * Usage:
 *   #include "pollcast.hpp"
 *
 *   int main() {
 *     auto store = std::make_shared<pollcast::MemoryStore>();
 *     pollcast::PollEngine engine(store);
 *     pollcast::ConnectionRegistry registry;
 *     pollcast::BroadcastDispatcher dispatcher(registry);
 *     pollcast::EventBridge bridge(*store, dispatcher);
 *     if (!bridge.start()) return 1;
 *
 *     pollcast::Server server(8080);
 *     pollcast::PollGateway gateway(engine, registry, dispatcher);
 *     gateway.attach(server);
 *     server.run();
 *   }
 *
 * @see RFC 6455: The WebSocket Protocol
 */

#ifndef POLLCAST_HPP_
#define POLLCAST_HPP_

#include "pollcast/codec.hpp"
#include "pollcast/config.hpp"
#include "pollcast/connection.hpp"
#include "pollcast/dispatcher.hpp"
#include "pollcast/event_bridge.hpp"
#include "pollcast/gateway.hpp"
#include "pollcast/http.hpp"
#include "pollcast/log.hpp"
#include "pollcast/memory_store.hpp"
#include "pollcast/poll.hpp"
#include "pollcast/poll_engine.hpp"
#include "pollcast/registry.hpp"
#include "pollcast/retry.hpp"
#include "pollcast/server.hpp"
#include "pollcast/store.hpp"
#include "pollcast/vocabulary.hpp"
#include "pollcast/websocket.hpp"
#include "pollcast/ws_channel.hpp"

#endif  // POLLCAST_HPP_
