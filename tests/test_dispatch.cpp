#include "test_support.hpp"

#include "glasskey/concurrent_queue.hpp"
#include "glasskey/dispatch_queue.hpp"
#include "glasskey/touch_snapshot.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include <linux/input.h>

namespace {

using namespace glasskey;
using namespace std::chrono_literals;
using glasskey::test::touch;

/// Записывает вызовы инжектора в виде строк
class FakeInjector final : public OsInjector {
public:
  void key_event(ScanCode code, ModifierMask modifiers, bool down) override {
    record("key " + std::to_string(code) + " " + std::to_string(modifiers) +
           (down ? " down" : " up"));
  }
  void pointer_move(int dx, int dy) override {
    record("move " + std::to_string(dx) + " " + std::to_string(dy));
  }
  void click(MouseButton button, int count) override {
    record("click " + std::to_string(static_cast<int>(button)) + " x" +
           std::to_string(count));
  }
  void haptic_pulse(double, Side device) override {
    record("haptic " + std::string{side_name(device)});
  }

  std::vector<std::string> calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_;
  }

private:
  void record(std::string call) {
    std::lock_guard<std::mutex> lock(mu_);
    calls_.push_back(std::move(call));
  }

  mutable std::mutex mu_;
  std::vector<std::string> calls_;
};

Command key_tap(ScanCode code) {
  Command c;
  c.kind = CommandKind::KeyTap;
  c.code = code;
  return c;
}

void test_overflow_drops_newest() {
  DispatchQueue queue{2};
  CHECK(queue.enqueue(key_tap(KEY_A)));
  CHECK(queue.enqueue(key_tap(KEY_B)));
  CHECK(!queue.enqueue(key_tap(KEY_C)));
  queue.submit(key_tap(KEY_D));

  const DispatchMetrics m = queue.snapshot_metrics();
  CHECK(m.queue_depth == 2);
  CHECK(m.drops == 2);
  CHECK(m.enqueued == 2);

  Command out;
  CHECK(queue.try_dequeue(out) && out.code == KEY_A);
  CHECK(queue.try_dequeue(out) && out.code == KEY_B);
  CHECK(!queue.try_dequeue(out));
}

void test_delivery_in_order() {
  FakeInjector injector;
  DispatchQueue queue{16};

  Command shift;
  shift.kind = CommandKind::ModifierDown;
  shift.code = KEY_LEFTSHIFT;
  Command chord = key_tap(KEY_1);
  chord.modifiers = kModShift;
  Command move;
  move.kind = CommandKind::PointerMove;
  move.dx = 3;
  move.dy = -2;
  Command click;
  click.kind = CommandKind::MouseClick;
  click.button = MouseButton::Right;
  Command haptic;
  haptic.kind = CommandKind::Haptic;
  haptic.side = Side::Left;

  CHECK(queue.enqueue(shift));
  CHECK(queue.enqueue(chord));
  CHECK(queue.enqueue(move));
  CHECK(queue.enqueue(click));
  CHECK(queue.enqueue(haptic));

  queue.start(injector);
  CHECK(queue.wait_idle(2000ms));
  queue.stop();

  const std::vector<std::string> expected{
      "key " + std::to_string(KEY_LEFTSHIFT) + " 0 down",
      "key " + std::to_string(KEY_1) + " 1 down",
      "key " + std::to_string(KEY_1) + " 1 up",
      "move 3 -2",
      "click 1 x1",
      "haptic left",
  };
  CHECK(injector.calls() == expected);

  const DispatchMetrics m = queue.snapshot_metrics();
  CHECK(m.delivered == 5);
  CHECK(m.queue_depth == 0);
}

void test_clear_queue() {
  DispatchQueue queue{8};
  for (int i = 0; i < 5; ++i) {
    CHECK(queue.enqueue(key_tap(KEY_A)));
  }
  queue.clear_queue();
  CHECK(queue.snapshot_metrics().queue_depth == 0);
  CHECK(queue.wait_idle(10ms));

  // После очистки буфер снова принимает полную ёмкость
  for (std::size_t i = 0; i < queue.capacity(); ++i) {
    CHECK(queue.enqueue(key_tap(KEY_B)));
  }
  CHECK(!queue.enqueue(key_tap(KEY_B)));
}

void test_concurrent_queue() {
  ConcurrentQueue<int> q;
  q.push(1);
  q.push(2);
  CHECK(q.size() == 2);

  int v = 0;
  CHECK(q.try_pop(v) && v == 1);

  std::stop_source src;
  auto got = q.pop_wait_for(src.get_token(), 10ms);
  CHECK(got.has_value() && *got == 2);
  CHECK(!q.pop_wait_for(src.get_token(), 10ms).has_value());
}

void test_coalescer() {
  TouchSnapshotCoalescer coalescer;
  const std::vector<Contact> one{touch(1, 0.2, 0.2)};
  const std::vector<Contact> two{touch(1, 0.3, 0.3), touch(2, 0.5, 0.5)};

  // Первое обновление выпускается сразу
  CHECK(coalescer.update(Side::Left, one, 1.000));
  CHECK(coalescer.snapshot().revision == 1);
  CHECK(coalescer.snapshot().left.size() == 1);

  // Одна сторона внутри интервала: откладывается
  CHECK(!coalescer.update(Side::Left, two, 1.005));
  CHECK(coalescer.snapshot().left.size() == 1);
  CHECK(!coalescer.flush_if_due(1.010));
  CHECK(coalescer.flush_if_due(1.021));
  CHECK(coalescer.snapshot().revision == 2);
  CHECK(coalescer.snapshot().left.size() == 2);

  // Обе стороны обновились: выпуск без ожидания
  CHECK(!coalescer.update(Side::Left, one, 1.025));
  CHECK(coalescer.update(Side::Right, two, 1.026));
  CHECK(coalescer.snapshot().revision == 3);
  CHECK(coalescer.snapshot().right.size() == 2);

  CHECK(!coalescer.snapshot_if_updated_since(3).has_value());
  CHECK(coalescer.snapshot_if_updated_since(1).has_value());

  // Пустой кадр очищает сторону
  CHECK(coalescer.update(Side::Right, {}, 1.1));
  CHECK(coalescer.snapshot().right.empty());

  const std::vector<Contact> starting{
      touch(3, 0.5, 0.5, 0.0f, ContactState::Starting)};
  CHECK(coalescer.update(Side::Left, starting, 1.2));
  CHECK(coalescer.snapshot().transitional);
}

void test_snapshot_service() {
  TouchSnapshotService service;
  service.start();

  RawTouchFrame frame;
  frame.side = Side::Right;
  frame.timestamp = monotonic_seconds();
  frame.contacts = {touch(1, 0.4, 0.4)};
  service.submit(frame);

  auto snap = service.wait_for_update(0, 2000ms);
  CHECK(snap.has_value());
  CHECK(snap->revision >= 1);
  CHECK(snap->right.size() == 1);

  service.stop();
}

void test_snapshot_service_ignores_frame_clock() {
  std::atomic<double> clock{1.0};
  TouchSnapshotService service{[&] { return clock.load(); }};
  service.start();

  // Метки кадров из захвата далеко впереди часов службы
  RawTouchFrame frame;
  frame.side = Side::Left;
  frame.timestamp = 1.0e9;
  frame.contacts = {touch(1, 0.2, 0.2)};
  service.submit(frame);
  auto first = service.wait_for_update(0, 2000ms);
  CHECK(first.has_value());
  CHECK(first->revision == 1);
  CHECK(first->timestamp == 1.0);

  // Вторая правка той же стороны внутри интервала откладывается
  frame.timestamp = 1.0e9 + 0.005;
  frame.contacts = {touch(1, 0.3, 0.3), touch(2, 0.6, 0.6)};
  service.submit(frame);
  CHECK(!service.wait_for_update(1, 100ms).has_value());

  // Часы службы ушли вперёд: отложенный снимок выпускается
  clock.store(1.05);
  auto second = service.wait_for_update(1, 2000ms);
  CHECK(second.has_value());
  CHECK(second->revision == 2);
  CHECK(second->left.size() == 2);
  CHECK(second->timestamp == 1.05);

  service.stop();
}

} // namespace

int main() {
  test_overflow_drops_newest();
  test_delivery_in_order();
  test_clear_queue();
  test_concurrent_queue();
  test_coalescer();
  test_snapshot_service();
  test_snapshot_service_ignores_frame_clock();

  std::cout << "OK\n";
  return 0;
}
