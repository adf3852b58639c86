#include "base.hh"

#include <seastar/core/coroutine.hh>

#include "kvchain/config.hh"
#include "test/helper.hh"

using namespace std;
using namespace seastar;

namespace kvchain::test {

void base::SetUp() {
  app_template::config app_cfg;
  app_cfg.auto_handle_sigint_sigterm = false;
  _app = make_unique<app_template>(std::move(app_cfg));
  std::promise<void> pr;
  auto fut = pr.get_future();
  // We cannot use `pr = std::move(pr)` here as it will forbid compilation
  // see https://taylorconor.com/blog/noncopyable-lambdas/
  auto engine_func = [this, &pr]() mutable -> seastar::future<> {
    l.info("reactor engine starting...");
    l.info("initialize config {}", helper::default_config());
    config::initialize(helper::default_config());
    co_await config::broadcast();
    _stop.emplace();
    auto stopped = _stop->get_future();
    pr.set_value();
    co_await std::move(stopped);
    l.info("reactor engine exiting...");
    co_return;
  };
  _engine_thread = std::thread([this, func = std::move(engine_func)]() mutable {
    return _app->run(_argc, _argv, std::move(func));
  });
  fut.get();
}

void base::TearDown() {
  vector<std::future<void>> futs;
  for (auto shard = 0U; shard < smp::count; ++shard) {
    futs.emplace_back(
        alien::submit_to(*alien::internal::default_instance, shard, [] {
          return make_ready_future<>();
        }));
  }
  for (auto&& fut : futs) {
    fut.get();
  }
  submit([this] {
    _stop->set_value();
    return make_ready_future<>();
  });
  _engine_thread.join();
}

void base::submit(std::function<seastar::future<>()> func, unsigned shard_id) {
  if (shard_id >= seastar::smp::count) {
    l.error("invalid shard:{}, maximal:{}", shard_id, seastar::smp::count);
    std::abort();
  }
  seastar::alien::submit_to(
      *seastar::alien::internal::default_instance, shard_id, std::move(func))
      .get();
}

seastar::logger l{"kvchain_test"};

}  // namespace kvchain::test

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  ::testing::AddGlobalTestEnvironment(new kvchain::test::base(argc, argv));
  return RUN_ALL_TESTS();
}
