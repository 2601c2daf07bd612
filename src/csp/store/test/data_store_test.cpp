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

#include "csp/store/data_stores.hpp"
#include "csp/store/error.hpp"
#include "csp/test/test_logger.hpp"
#include "csp/test/test_common_util.hpp"
#include <flow/error/error.hpp>
#include <boost/lexical_cast.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace csp::store::test
{

namespace
{

using csp::test::Test_logger;
using flow::error::Runtime_error;
using std::string;
using std::vector;
using std::unique_ptr;

/// Every policy, for tests that hold across all of them.
const vector<Buffer_policy> S_ALL_POLICIES{ Buffer_policy::S_FIFO, Buffer_policy::S_OVERWRITE_OLDEST,
                                            Buffer_policy::S_OVERWRITE_NEWEST, Buffer_policy::S_OVERFLOW_DROP,
                                            Buffer_policy::S_INFINITE };

/// Drains `store`, returning what came out, in order.
template<typename Value>
vector<Value> drain(Data_store<Value>* store)
{
  vector<Value> result;
  while (store->state() != Store_state::S_EMPTY)
  {
    result.push_back(store->get());
  }
  return result;
}

/// Expects that constructing with `capacity` throws with S_INVALID_CAPACITY for `policy`.
void expect_invalid_capacity(flow::log::Logger* logger, Buffer_policy policy, int capacity)
{
  try
  {
    make_data_store<string>(logger, Store_config{ policy, capacity });
    ADD_FAILURE() << "Policy [" << policy << "] accepted capacity [" << capacity << "].";
  }
  catch (const Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Error_code(error::Code::S_INVALID_CAPACITY)) << "Policy [" << policy << "].";
  }
}

} // Anonymous namespace

TEST(Overwrite_oldest_buffer, Overwrite_keeps_newest)
{
  Test_logger logger;
  Overwrite_oldest_buffer<string> store(&logger, 3);

  EXPECT_EQ(store.state(), Store_state::S_EMPTY);
  for (const string& value : { "A", "B", "C", "D", "E" })
  {
    store.put(value);
    EXPECT_EQ(store.state(), Store_state::S_NONEMPTYFULL);
  }
  EXPECT_EQ(store.size(), 3u);

  EXPECT_EQ(store.get(), "C");
  EXPECT_EQ(store.get(), "D");
  EXPECT_EQ(store.get(), "E");
  EXPECT_EQ(store.state(), Store_state::S_EMPTY);
}

TEST(Overwrite_oldest_buffer, Get_returns_value_from_n_puts_ago)
{
  Test_logger logger;
  constexpr int N = 4;
  Overwrite_oldest_buffer<int> store(&logger, N);

  // Interleave: after each put beyond the first N, the oldest survivor is the one put exactly N puts ago.
  int next = 0;
  for (int i = 0; i != N; ++i)
  {
    store.put(next++);
  }
  for (int round = 0; round != 20; ++round)
  {
    store.put(next++);
    const int got = store.get();
    EXPECT_EQ(got, next - N) << "Round [" << round << "].";
    store.put(next++); // Back to full for the next round.
    EXPECT_EQ(store.size(), size_t(N));
  }
}

TEST(Overwrite_oldest_buffer, Round_trip_below_capacity)
{
  Test_logger logger;
  constexpr int N = 5;

  for (int k = 1; k <= N; ++k)
  {
    Overwrite_oldest_buffer<int> store(&logger, N);
    vector<int> expected;
    for (int i = 0; i != k; ++i)
    {
      store.put(i * 10);
      expected.push_back(i * 10);
    }
    EXPECT_EQ(drain<int>(&store), expected) << "k = [" << k << "].";
  }
}

TEST(Overwrite_oldest_buffer, Never_reports_full)
{
  Test_logger logger;
  Overwrite_oldest_buffer<int> store(&logger, 2);

  for (int i = 0; i != 50; ++i)
  {
    store.put(i);
    EXPECT_NE(store.state(), Store_state::S_FULL);
    if ((i % 7) == 0)
    {
      store.get();
    }
  }
}

TEST(Overwrite_oldest_buffer, Capacity_one)
{
  Test_logger logger;
  Overwrite_oldest_buffer<string> store(&logger, 1);

  store.put("X");
  store.put("Y");
  EXPECT_EQ(store.state(), Store_state::S_NONEMPTYFULL);
  EXPECT_EQ(store.get(), "Y");
  EXPECT_EQ(store.state(), Store_state::S_EMPTY);
}

TEST(Overwrite_oldest_buffer, Clone_is_empty_and_independent)
{
  Test_logger logger;
  Overwrite_oldest_buffer<string> store(&logger, 3);
  store.put("A");
  store.put("B");

  const auto clone = store.clone_empty();
  ASSERT_TRUE(clone);
  EXPECT_EQ(clone->state(), Store_state::S_EMPTY);
  EXPECT_EQ(clone->capacity(), 3);
  EXPECT_EQ(clone->policy(), Buffer_policy::S_OVERWRITE_OLDEST);

  clone->put("Z");
  EXPECT_EQ(store.size(), 2u);
  EXPECT_EQ(store.get(), "A");
  EXPECT_EQ(clone->get(), "Z");
  EXPECT_EQ(store.get(), "B");
}

TEST(Data_store, Invalid_capacity_rejected_by_every_policy)
{
  Test_logger logger;
  for (const auto policy : S_ALL_POLICIES)
  {
    expect_invalid_capacity(&logger, policy, 0);
    expect_invalid_capacity(&logger, policy, -1);
  }

  EXPECT_THROW(Overwrite_oldest_buffer<int>(&logger, 0), Runtime_error);
  EXPECT_THROW(Fifo_buffer<int>(&logger, -5), Runtime_error);
}

TEST(Data_store, Unknown_policy_rejected)
{
  Test_logger logger;
  try
  {
    make_data_store<int>(&logger, Store_config{ Buffer_policy::S_END_SENTINEL, 4 });
    ADD_FAILURE() << "Sentinel policy accepted.";
  }
  catch (const Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Error_code(error::Code::S_UNKNOWN_POLICY));
  }
}

TEST(Data_store, Factory_builds_each_policy)
{
  Test_logger logger;
  for (const auto policy : S_ALL_POLICIES)
  {
    const Store_config config{ policy, 2 };
    const unique_ptr<Data_store<int>> store = make_data_store<int>(&logger, config);
    ASSERT_TRUE(store);
    EXPECT_EQ(store->config(), config);
    EXPECT_EQ(store->state(), Store_state::S_EMPTY);

    const auto clone = store->clone_empty();
    EXPECT_EQ(clone->config(), config);
  }
}

TEST(Data_store, Empty_iff_nothing_buffered)
{
  Test_logger logger;
  for (const auto policy : S_ALL_POLICIES)
  {
    const auto store = make_data_store<int>(&logger, Store_config{ policy, 3 });
    for (int i = 0; i != 3; ++i)
    {
      store->put(i);
      EXPECT_NE(store->state(), Store_state::S_EMPTY) << "Policy [" << policy << "].";
      EXPECT_EQ(store->size(), size_t(i + 1));
    }
    while (store->size() != 0)
    {
      EXPECT_NE(store->state(), Store_state::S_EMPTY);
      store->get();
    }
    EXPECT_EQ(store->state(), Store_state::S_EMPTY) << "Policy [" << policy << "].";
  }
}

TEST(Fifo_buffer, Reports_full_and_keeps_order)
{
  Test_logger logger;
  Fifo_buffer<int> store(&logger, 3);

  EXPECT_EQ(store.state(), Store_state::S_EMPTY);
  store.put(1);
  EXPECT_EQ(store.state(), Store_state::S_NONEMPTYFULL);
  store.put(2);
  store.put(3);
  EXPECT_EQ(store.state(), Store_state::S_FULL);

  EXPECT_EQ(store.get(), 1);
  EXPECT_EQ(store.state(), Store_state::S_NONEMPTYFULL);
  store.put(4);
  EXPECT_EQ(drain<int>(&store), (vector<int>{ 2, 3, 4 }));
}

TEST(Overwriting_buffer, Replaces_newest_when_full)
{
  Test_logger logger;
  Overwriting_buffer<string> store(&logger, 3);

  for (const string& value : { "A", "B", "C", "D", "E" })
  {
    store.put(value);
  }
  EXPECT_EQ(store.state(), Store_state::S_NONEMPTYFULL);
  EXPECT_EQ(drain<string>(&store), (vector<string>{ "A", "B", "E" }));
}

TEST(Overflowing_buffer, Drops_new_when_full)
{
  Test_logger logger;
  Overflowing_buffer<string> store(&logger, 3);

  for (const string& value : { "A", "B", "C", "D", "E" })
  {
    store.put(value);
  }
  EXPECT_EQ(store.state(), Store_state::S_NONEMPTYFULL);
  EXPECT_EQ(drain<string>(&store), (vector<string>{ "A", "B", "C" }));
}

TEST(Infinite_buffer, Grows_past_initial_capacity)
{
  Test_logger logger;
  Infinite_buffer<int> store(&logger, 2);

  vector<int> expected;
  for (int i = 0; i != 100; ++i)
  {
    store.put(i);
    expected.push_back(i);
    EXPECT_EQ(store.state(), Store_state::S_NONEMPTYFULL);
  }
  EXPECT_EQ(store.capacity(), 2);
  EXPECT_EQ(drain<int>(&store), expected);

  const auto clone = store.clone_empty();
  EXPECT_EQ(clone->capacity(), 2);
  EXPECT_EQ(clone->state(), Store_state::S_EMPTY);
}

TEST(Store_config, Stream_io)
{
  EXPECT_EQ(boost::lexical_cast<string>(Store_config{ Buffer_policy::S_OVERWRITE_OLDEST, 16 }),
            "OVERWRITE_OLDEST:16");

  EXPECT_EQ(boost::lexical_cast<Store_config>("OVERWRITE_OLDEST:16"),
            (Store_config{ Buffer_policy::S_OVERWRITE_OLDEST, 16 }));
  EXPECT_EQ(boost::lexical_cast<Store_config>("fifo:3"), (Store_config{ Buffer_policy::S_FIFO, 3 }));

  EXPECT_THROW(boost::lexical_cast<Store_config>("NO_SUCH_POLICY:3"), boost::bad_lexical_cast);
  EXPECT_THROW(boost::lexical_cast<Store_config>("FIFO"), boost::bad_lexical_cast);
  EXPECT_THROW(boost::lexical_cast<Store_config>("FIFO-3"), boost::bad_lexical_cast);

  EXPECT_EQ(boost::lexical_cast<Buffer_policy>("infinite"), Buffer_policy::S_INFINITE);
  EXPECT_EQ(boost::lexical_cast<string>(Store_state::S_NONEMPTYFULL), "NONEMPTYFULL");
}

TEST(Store_error, Codes)
{
  const Error_code err_code = error::Code::S_INVALID_CAPACITY;
  EXPECT_STREQ(err_code.category().name(), "csp/store");
  EXPECT_FALSE(err_code.message().empty());
  EXPECT_EQ(err_code.value(), csp::test::to_underlying(error::Code::S_INVALID_CAPACITY));

  EXPECT_EQ(boost::lexical_cast<string>(error::Code::S_UNKNOWN_POLICY), "UNKNOWN_POLICY");
  EXPECT_EQ(boost::lexical_cast<error::Code>("invalid_capacity"), error::Code::S_INVALID_CAPACITY);
}

#ifndef NDEBUG
TEST(Data_store_death_test, Get_on_empty_is_contract_violation)
{
  Test_logger logger;
  Overwrite_oldest_buffer<int> store(&logger, 2);
  EXPECT_DEATH(store.get(), "EMPTY");
}

TEST(Data_store_death_test, Put_on_full_fifo_is_contract_violation)
{
  Test_logger logger;
  Fifo_buffer<int> store(&logger, 1);
  store.put(1);
  EXPECT_DEATH(store.put(2), "FULL");
}
#endif

} // namespace csp::store::test
