/* Flow-CSP: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

#include "csp/net/migratable_channel_output.hpp"
#include "csp/net/loopback_network.hpp"
#include "csp/store/infinite_buffer.hpp"
#include "csp/store/fifo_buffer.hpp"
#include "csp/test/test_logger.hpp"
#include "csp/test/test_common_util.hpp"
#include <flow/error/error.hpp>
#include <boost/lexical_cast.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

namespace csp::net::test
{

namespace
{

using csp::test::Test_logger;
using csp::test::get_test_suite_name;
using store::Data_store;
using store::Infinite_buffer;
using store::Fifo_buffer;
using flow::error::Runtime_error;
using std::string;
using std::make_shared;
using std::make_unique;

using Endpoint = Migratable_channel_output<string>;

/// Link_factory that runs a hook just before forwarding connect() to the real factory.
class Hooked_factory :
  public Link_factory<string>
{
public:
  explicit Hooked_factory(Link_factory<string>* real) :
    m_real(real)
  {
  }

  std::unique_ptr<Output_link<string>> connect(const Endpoint_id& endpoint_id, Error_code* err_code) override
  {
    if (m_hook)
    {
      m_hook(endpoint_id);
    }
    return m_real->connect(endpoint_id, err_code);
  }

  /// Invoked from connect(), with no lock held by the endpoint.
  Function<void (const Endpoint_id&)> m_hook;

private:
  Link_factory<string>* const m_real;
}; // class Hooked_factory

/// Write_filter appending a tag to each value and counting quiesce() calls.
class Tagging_filter :
  public Write_filter<string>
{
public:
  explicit Tagging_filter(const string& tag) :
    m_tag(tag),
    m_quiesce_count(0)
  {
  }

  string filter(string value) override
  {
    return value + m_tag;
  }

  void quiesce() override
  {
    ++m_quiesce_count;
  }

  const string m_tag;
  unsigned int m_quiesce_count;
}; // class Tagging_filter

} // Anonymous namespace

/// Two reachable locations on a loopback network, each read into an unbounded store; and a registry.
class Migratable_channel_output_test :
  public ::testing::Test
{
protected:
  Migratable_channel_output_test() :
    m_network(&m_logger, "net"),
    m_registry(&m_logger, "reg"),
    m_loc1("host-1:4000", 1),
    m_loc2("host-2:4000", 1),
    m_channel(generate_channel_id())
  {
    m_network.open_input(m_loc1, make_unique<Infinite_buffer<string>>(&m_logger));
    m_network.open_input(m_loc2, make_unique<Infinite_buffer<string>>(&m_logger));
  }

  /// Makes an endpoint of #m_channel, not yet bound, using #m_network directly.
  Endpoint make_endpoint(Link_factory<string>* link_factory = 0)
  {
    return Endpoint(&m_logger, get_test_suite_name(), Endpoint_id{ m_channel, Channel_location() },
                    link_factory ? link_factory : &m_network, &m_registry);
  }

  /// Takes everything out of the input at `loc`, concatenated with '|' separators.
  string drain(const Channel_location& loc)
  {
    Data_store<string>* const store = m_network.input_store(loc);
    string result;
    while (store->state() != store::Store_state::S_EMPTY)
    {
      result += (result.empty() ? "" : "|") + store->get();
    }
    return result;
  }

  Test_logger m_logger;
  Loopback_network<string> m_network;
  Binding_registry m_registry;
  const Channel_location m_loc1;
  const Channel_location m_loc2;
  const Channel_id m_channel;
}; // class Migratable_channel_output_test

TEST_F(Migratable_channel_output_test, Bind_and_write)
{
  auto endpoint = make_endpoint();
  EXPECT_EQ(endpoint.state(), Connection_state::S_DISCONNECTED);
  EXPECT_EQ(endpoint.channel_id(), m_channel);

  Error_code err_code;
  EXPECT_FALSE(endpoint.write("lost", &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_NOT_CONNECTED));

  EXPECT_TRUE(endpoint.bind(m_loc1, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(endpoint.state(), Connection_state::S_CONNECTED);
  EXPECT_EQ(endpoint.location(), m_loc1);
  EXPECT_EQ(endpoint.endpoint_id(), (Endpoint_id{ m_channel, m_loc1 }));
  EXPECT_EQ(m_network.live_link_count(), 1u);

  Channel_location live;
  ASSERT_TRUE(m_registry.live_location(m_channel, &live));
  EXPECT_EQ(live, m_loc1);

  EXPECT_TRUE(endpoint.write("a", &err_code));
  EXPECT_TRUE(endpoint.write("b"));
  EXPECT_EQ(drain(m_loc1), "a|b");

  // Same location: no-op.  Elsewhere: not while connected.
  EXPECT_FALSE(endpoint.bind(m_loc1, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_FALSE(endpoint.bind(m_loc2, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_ENDPOINT_STATE_INVALID_FOR_OP));
  EXPECT_EQ(endpoint.state(), Connection_state::S_CONNECTED);
  EXPECT_EQ(endpoint.location(), m_loc1);

  EXPECT_FALSE(endpoint.recreate(m_loc2, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_ENDPOINT_STATE_INVALID_FOR_OP));
}

TEST_F(Migratable_channel_output_test, Relocate_keeps_channel_id)
{
  auto endpoint = make_endpoint();
  endpoint.bind(m_loc1);
  endpoint.write("before");

  EXPECT_TRUE(endpoint.prepare_to_move());
  EXPECT_EQ(endpoint.state(), Connection_state::S_DISCONNECTED);
  EXPECT_FALSE(endpoint.prepare_to_move()); // Not connected: no-op.
  // Old binding is gone: no link, no registry entry.
  EXPECT_EQ(m_network.live_link_count(), 0u);
  EXPECT_FALSE(m_registry.live_location(m_channel));

  Error_code err_code;
  EXPECT_FALSE(endpoint.write("in-window", &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_NOT_CONNECTED));
  EXPECT_THROW(endpoint.write("in-window"), Runtime_error);

  EXPECT_TRUE(endpoint.recreate(m_loc2, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(endpoint.state(), Connection_state::S_CONNECTED);
  EXPECT_EQ(endpoint.channel_id(), m_channel);
  EXPECT_EQ(endpoint.location(), m_loc2);
  endpoint.write("after");

  EXPECT_EQ(drain(m_loc1), "before");
  EXPECT_EQ(drain(m_loc2), "after");
  EXPECT_EQ(m_network.live_link_count(), 1u);

  Channel_location live;
  ASSERT_TRUE(m_registry.live_location(m_channel, &live));
  EXPECT_EQ(live, m_loc2);
}

TEST_F(Migratable_channel_output_test, Writes_rejected_while_reconnecting)
{
  Hooked_factory factory(&m_network);
  auto endpoint = make_endpoint(&factory);

  unsigned int n_hook_calls = 0;
  factory.m_hook = [&](const Endpoint_id& target)
  {
    ++n_hook_calls;
    EXPECT_EQ(target, (Endpoint_id{ m_channel, m_loc1 }));
    EXPECT_EQ(endpoint.state(), Connection_state::S_RECONNECTING);

    Error_code err_code;
    EXPECT_FALSE(endpoint.write("too-early", &err_code));
    EXPECT_EQ(err_code, Error_code(error::Code::S_NOT_CONNECTED));

    EXPECT_FALSE(endpoint.recreate(&err_code));
    EXPECT_EQ(err_code, Error_code(error::Code::S_ENDPOINT_STATE_INVALID_FOR_OP));
    EXPECT_FALSE(endpoint.prepare_to_move());
    EXPECT_FALSE(endpoint.set_link_factory(&m_network, &err_code));
    EXPECT_EQ(err_code, Error_code(error::Code::S_ENDPOINT_STATE_INVALID_FOR_OP));
  };

  EXPECT_TRUE(endpoint.bind(m_loc1));
  EXPECT_EQ(n_hook_calls, 1u);
  EXPECT_EQ(endpoint.state(), Connection_state::S_CONNECTED);
  endpoint.write("on-time");
  EXPECT_EQ(drain(m_loc1), "on-time");
}

TEST_F(Migratable_channel_output_test, Unreachable_location_then_retry)
{
  auto endpoint = make_endpoint();
  endpoint.bind(m_loc1);
  endpoint.prepare_to_move();

  m_network.set_reachable(m_loc2, false);
  Error_code err_code;
  EXPECT_FALSE(endpoint.recreate(m_loc2, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_LOCATION_UNREACHABLE));
  EXPECT_EQ(endpoint.state(), Connection_state::S_DISCONNECTED);
  EXPECT_EQ(endpoint.location(), m_loc2); // Last attempt.
  EXPECT_FALSE(m_registry.live_location(m_channel)); // Claim given back.
  EXPECT_EQ(m_network.live_link_count(), 0u);

  try
  {
    endpoint.recreate();
    ADD_FAILURE() << "Recreate at unreachable location did not throw.";
  }
  catch (const Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Error_code(error::Code::S_LOCATION_UNREACHABLE));
  }
  EXPECT_EQ(endpoint.state(), Connection_state::S_DISCONNECTED);

  m_network.set_reachable(m_loc2, true);
  EXPECT_TRUE(endpoint.recreate(&err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(endpoint.state(), Connection_state::S_CONNECTED);
  EXPECT_EQ(endpoint.location(), m_loc2);
}

TEST_F(Migratable_channel_output_test, Recreate_needs_a_location)
{
  auto endpoint = make_endpoint();
  Error_code err_code;
  EXPECT_FALSE(endpoint.recreate(&err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_ARGUMENT));
  EXPECT_FALSE(endpoint.bind(Channel_location(), &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_ARGUMENT));
  EXPECT_EQ(endpoint.state(), Connection_state::S_DISCONNECTED);
}

TEST_F(Migratable_channel_output_test, Second_binding_refused)
{
  auto endpoint = make_endpoint();
  auto twin = make_endpoint();
  endpoint.bind(m_loc1);

  Error_code err_code;
  EXPECT_FALSE(twin.bind(m_loc2, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_CHANNEL_ALREADY_BOUND));
  EXPECT_EQ(twin.state(), Connection_state::S_DISCONNECTED);
  EXPECT_EQ(m_network.live_link_count(), 1u);

  // Same location as the live binding: still a second binding.
  EXPECT_FALSE(twin.bind(m_loc1, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_CHANNEL_ALREADY_BOUND));
  EXPECT_EQ(twin.state(), Connection_state::S_DISCONNECTED);
  EXPECT_EQ(m_network.live_link_count(), 1u);
  Channel_location live;
  ASSERT_TRUE(m_registry.live_location(m_channel, &live));
  EXPECT_EQ(live, m_loc1);

  // Once the first moves away, the twin may bind.
  endpoint.prepare_to_move();
  EXPECT_TRUE(twin.bind(m_loc2, &err_code));
  EXPECT_FALSE(endpoint.recreate(m_loc1, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_CHANNEL_ALREADY_BOUND));
}

TEST_F(Migratable_channel_output_test, Unbound_endpoint_teardown_keeps_live_binding)
{
  auto endpoint = make_endpoint();
  endpoint.bind(m_loc1);

  Error_code err_code;
  {
    auto twin = make_endpoint();
    EXPECT_FALSE(twin.bind(m_loc2, &err_code));
    EXPECT_EQ(err_code, Error_code(error::Code::S_CHANNEL_ALREADY_BOUND));
    EXPECT_TRUE(twin.destroy());
  }
  {
    auto twin = make_endpoint();
    EXPECT_FALSE(twin.bind(m_loc1, &err_code));
    twin = make_endpoint(); // The refused one goes away by move-assignment.
  } // And the never-bound one by destruction.

  Channel_location live;
  ASSERT_TRUE(m_registry.live_location(m_channel, &live));
  EXPECT_EQ(live, m_loc1);
  EXPECT_EQ(m_registry.live_count(), 1u);

  auto third = make_endpoint();
  EXPECT_FALSE(third.bind(m_loc2, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_CHANNEL_ALREADY_BOUND));
  EXPECT_EQ(third.state(), Connection_state::S_DISCONNECTED);
  EXPECT_EQ(m_network.live_link_count(), 1u);

  EXPECT_TRUE(endpoint.write("still", &err_code));
  EXPECT_EQ(drain(m_loc1), "still");

  // The rightful owner's own teardown does release it.
  endpoint.destroy();
  EXPECT_FALSE(m_registry.live_location(m_channel));
  EXPECT_TRUE(third.bind(m_loc2, &err_code));
}

TEST_F(Migratable_channel_output_test, Failed_connect_releases_own_claim_only)
{
  m_network.set_reachable(m_loc2, false);

  auto endpoint = make_endpoint();
  Error_code err_code;
  EXPECT_FALSE(endpoint.bind(m_loc2, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_LOCATION_UNREACHABLE));
  EXPECT_FALSE(m_registry.live_location(m_channel));

  // It held no claim after the failure; dropping it later must not disturb a new owner.
  auto owner = make_endpoint();
  EXPECT_TRUE(owner.bind(m_loc1, &err_code));
  EXPECT_TRUE(endpoint.destroy());

  Channel_location live;
  ASSERT_TRUE(m_registry.live_location(m_channel, &live));
  EXPECT_EQ(live, m_loc1);
}

TEST_F(Migratable_channel_output_test, Full_fifo_input_refuses_without_disconnecting)
{
  const Channel_location loc3("host-3:4000", 1);
  m_network.open_input(loc3, make_unique<Fifo_buffer<string>>(&m_logger, 2));

  auto endpoint = make_endpoint();
  endpoint.bind(loc3);
  endpoint.write("a");
  endpoint.write("b");

  Data_store<string>* const store = m_network.input_store(loc3);
  EXPECT_EQ(store->state(), store::Store_state::S_FULL);

  Error_code err_code;
  EXPECT_FALSE(endpoint.write("c", &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_INPUT_FULL));
  EXPECT_EQ(store->size(), 2u);
  EXPECT_EQ(endpoint.state(), Connection_state::S_CONNECTED);
  EXPECT_EQ(m_network.live_link_count(), 1u);
  EXPECT_TRUE(m_registry.live_location(m_channel));

  // A reader makes room; the same binding carries on.
  EXPECT_EQ(store->get(), "a");
  EXPECT_TRUE(endpoint.write("c", &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(drain(loc3), "b|c");

  endpoint.destroy();
  m_network.close_input(loc3);
}

TEST_F(Migratable_channel_output_test, Send_failure_disconnects)
{
  auto endpoint = make_endpoint();
  endpoint.bind(m_loc1);

  m_network.close_input(m_loc1);
  Error_code err_code;
  EXPECT_FALSE(endpoint.write("x", &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_LINK_HOSED));
  EXPECT_EQ(endpoint.state(), Connection_state::S_DISCONNECTED);
  EXPECT_EQ(m_network.live_link_count(), 0u);
  EXPECT_FALSE(m_registry.live_location(m_channel));

  m_network.open_input(m_loc1, make_unique<Infinite_buffer<string>>(&m_logger));
  EXPECT_TRUE(endpoint.recreate(&err_code));
  endpoint.write("y");
  EXPECT_EQ(drain(m_loc1), "y");
}

TEST_F(Migratable_channel_output_test, Destroy_is_terminal)
{
  auto endpoint = make_endpoint();
  endpoint.bind(m_loc1);

  EXPECT_TRUE(endpoint.destroy());
  EXPECT_EQ(endpoint.state(), Connection_state::S_DESTROYED);
  EXPECT_EQ(m_network.live_link_count(), 0u);
  EXPECT_FALSE(m_registry.live_location(m_channel));
  EXPECT_FALSE(endpoint.destroy());
  EXPECT_FALSE(endpoint.prepare_to_move());

  Error_code err_code;
  EXPECT_FALSE(endpoint.write("x", &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_NOT_CONNECTED));
  EXPECT_FALSE(endpoint.recreate(&err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_ENDPOINT_DESTROYED));
  EXPECT_FALSE(endpoint.bind(m_loc2, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_ENDPOINT_DESTROYED));
  EXPECT_FALSE(endpoint.set_link_factory(&m_network, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_ENDPOINT_DESTROYED));
  EXPECT_EQ(endpoint.state(), Connection_state::S_DESTROYED);
}

TEST_F(Migratable_channel_output_test, Destroy_during_connect_wins)
{
  Hooked_factory factory(&m_network);
  auto endpoint = make_endpoint(&factory);
  factory.m_hook = [&](const Endpoint_id&)
  {
    EXPECT_TRUE(endpoint.destroy());
  };

  Error_code err_code;
  EXPECT_FALSE(endpoint.bind(m_loc1, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_ENDPOINT_DESTROYED));
  EXPECT_EQ(endpoint.state(), Connection_state::S_DESTROYED);
  EXPECT_EQ(m_network.live_link_count(), 0u);
  EXPECT_FALSE(m_registry.live_location(m_channel));
}

TEST_F(Migratable_channel_output_test, Moved_from_is_null)
{
  auto endpoint = make_endpoint();
  endpoint.bind(m_loc1);

  Endpoint new_owner(std::move(endpoint));
  EXPECT_EQ(new_owner.state(), Connection_state::S_CONNECTED);
  EXPECT_EQ(new_owner.channel_id(), m_channel);
  EXPECT_TRUE(new_owner.write("via-new-owner"));

  EXPECT_EQ(endpoint.state(), Connection_state::S_NULL);
  EXPECT_TRUE(endpoint.channel_id().is_nil());
  EXPECT_TRUE(endpoint.location().null());
  EXPECT_TRUE(endpoint.nickname().empty());
  EXPECT_EQ(boost::lexical_cast<string>(endpoint), "null");
  EXPECT_FALSE(endpoint.prepare_to_move());
  EXPECT_FALSE(endpoint.destroy());
  EXPECT_EQ(endpoint.write_filter_count(), 0u);

  Error_code err_code;
  EXPECT_FALSE(endpoint.write("via-stale-handle", &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_ENDPOINT_NULL));
  EXPECT_FALSE(endpoint.recreate(m_loc2, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_ENDPOINT_NULL));
  EXPECT_THROW(endpoint.write("via-stale-handle"), Runtime_error);

  // Move-assignment back makes it usable again, and the source NULL.
  endpoint = std::move(new_owner);
  EXPECT_EQ(new_owner.state(), Connection_state::S_NULL);
  EXPECT_TRUE(endpoint.write("back"));
  EXPECT_EQ(drain(m_loc1), "via-new-owner|back");
  EXPECT_EQ(Endpoint().state(), Connection_state::S_NULL);
}

TEST_F(Migratable_channel_output_test, Write_filters)
{
  auto endpoint = make_endpoint();
  const auto filter_a = make_shared<Tagging_filter>("+a");
  const auto filter_b = make_shared<Tagging_filter>("+b");
  const auto filter_c = make_shared<Tagging_filter>("+c");

  Error_code err_code;
  EXPECT_TRUE(endpoint.add_write_filter(filter_a, &err_code));
  EXPECT_TRUE(endpoint.add_write_filter(filter_b, &err_code));
  EXPECT_TRUE(endpoint.add_write_filter(filter_c, 0, &err_code));
  EXPECT_EQ(endpoint.write_filter_count(), 3u);
  EXPECT_EQ(endpoint.write_filter(0), filter_c);
  EXPECT_EQ(endpoint.write_filter(2), filter_b);
  EXPECT_FALSE(endpoint.write_filter(3));

  EXPECT_FALSE(endpoint.add_write_filter(filter_a, 4, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_ARGUMENT));
  EXPECT_FALSE(endpoint.add_write_filter(nullptr, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_ARGUMENT));

  endpoint.bind(m_loc1);
  endpoint.write("v");
  EXPECT_EQ(drain(m_loc1), "v+c+a+b");

  // Filters are quiesced on the way out, and travel along.
  endpoint.prepare_to_move();
  EXPECT_EQ(filter_a->m_quiesce_count, 1u);
  EXPECT_EQ(filter_b->m_quiesce_count, 1u);
  EXPECT_EQ(filter_c->m_quiesce_count, 1u);
  endpoint.recreate(m_loc2);
  EXPECT_EQ(endpoint.write_filter_count(), 3u);

  EXPECT_TRUE(endpoint.remove_write_filter(filter_a.get()));
  EXPECT_FALSE(endpoint.remove_write_filter(filter_a.get()));
  EXPECT_FALSE(endpoint.remove_write_filter(5, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_ARGUMENT));
  EXPECT_TRUE(endpoint.remove_write_filter(0, &err_code));
  EXPECT_EQ(endpoint.write_filter_count(), 1u);
  EXPECT_EQ(endpoint.write_filter(0), filter_b);

  endpoint.write("w");
  EXPECT_EQ(drain(m_loc2), "w+b");
}

TEST_F(Migratable_channel_output_test, Concurrent_writes_during_relocations)
{
  auto endpoint = make_endpoint();
  endpoint.bind(m_loc1);

  std::atomic<bool> done(false);
  size_t n_sent = 0;
  size_t n_rejected = 0;
  std::thread writer([&]()
  {
    while (!done)
    {
      Error_code err_code;
      if (endpoint.write("v", &err_code))
      {
        ++n_sent;
      }
      else
      {
        EXPECT_EQ(err_code, Error_code(error::Code::S_NOT_CONNECTED));
        ++n_rejected;
      }
    }
  });

  for (unsigned int round = 0; round != 50; ++round)
  {
    EXPECT_TRUE(endpoint.prepare_to_move());
    EXPECT_TRUE(endpoint.recreate(((round % 2) == 0) ? m_loc2 : m_loc1));
  }
  done = true;
  writer.join();

  const auto n_delivered = m_network.input_store(m_loc1)->size() + m_network.input_store(m_loc2)->size();
  EXPECT_EQ(n_delivered, n_sent);
  EXPECT_EQ(endpoint.channel_id(), m_channel);
  EXPECT_EQ(m_network.live_link_count(), 1u);
}

} // namespace csp::net::test
