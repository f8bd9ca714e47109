#pragma once
#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace fx {

struct ParallelConfig {
  std::size_t n_threads   = 2;   // worker threads, >= 1
  std::size_t queue_len   = 2;   // record sets read ahead of the workers
  std::size_t max_records = 0;   // per record set, 0 = whatever the buffer holds
};

namespace detail {

template <class Set, class Out>
struct ParallelSlot {
  explicit ParallelSlot(std::size_t max_records) : set(max_records) {}

  Set set;
  Out out{};
  std::uint64_t seq = 0;
};

}

// Reads record sets on a background thread, runs `work(set, out)` for each
// on `cfg.n_threads` workers and passes every set with its output to
// `consume(set, out)` on the calling thread, in input order. `consume`
// returning false stops the run.
//
// Sets and outputs are recycled: `work` receives the output of an earlier
// set and has to overwrite it. `work` runs concurrently on several threads.
// The reader is only touched by the background thread until this returns.
//
// Returns false when stopped by `consume` or on a parse error (then
// reader.error() is set). An exception from `work` or `consume` stops all
// threads and is rethrown here.
template <class Out, class Reader, class Work, class Consume>
bool read_parallel(Reader& reader, const ParallelConfig& cfg, Work work, Consume consume) {
  using Set  = typename Reader::Set;
  using Slot = detail::ParallelSlot<Set, Out>;

  if (cfg.n_threads == 0) throw std::invalid_argument("read_parallel: n_threads must be > 0");

  const std::size_t n_slots = cfg.n_threads + std::max<std::size_t>(cfg.queue_len, 1);
  std::vector<std::unique_ptr<Slot>> slots;
  std::deque<Slot*> free_q;       // ready to be filled by the reader
  std::deque<Slot*> work_q;       // filled, waiting for a worker
  std::map<std::uint64_t, Slot*> done;   // processed, keyed by read order
  slots.reserve(n_slots);
  for (std::size_t i = 0; i < n_slots; ++i) {
    slots.push_back(std::make_unique<Slot>(cfg.max_records));
    free_q.push_back(slots.back().get());
  }

  std::mutex mu;
  std::condition_variable cv;
  bool stop = false;
  bool input_done = false;
  std::uint64_t n_read = 0;
  std::exception_ptr failure;

  auto fail_with = [&](std::exception_ptr e) {
    std::lock_guard<std::mutex> lk(mu);
    if (!failure) failure = e;
    stop = true;
    cv.notify_all();
  };

  auto read_loop = [&] {
    for (;;) {
      Slot* s = nullptr;
      {
        std::unique_lock<std::mutex> lk(mu);
        cv.wait(lk, [&] { return stop || !free_q.empty(); });
        if (stop) return;
        s = free_q.front();
        free_q.pop_front();
      }
      bool got = false;
      try {
        got = reader.read_record_set(s->set);
      } catch (...) {
        fail_with(std::current_exception());
        return;
      }
      std::lock_guard<std::mutex> lk(mu);
      if (!got) {
        input_done = true;
        cv.notify_all();
        return;
      }
      s->seq = n_read++;
      work_q.push_back(s);
      cv.notify_all();
    }
  };

  auto work_loop = [&] {
    for (;;) {
      Slot* s = nullptr;
      {
        std::unique_lock<std::mutex> lk(mu);
        cv.wait(lk, [&] { return stop || input_done || !work_q.empty(); });
        if (stop || work_q.empty()) return;
        s = work_q.front();
        work_q.pop_front();
      }
      try {
        work(static_cast<const Set&>(s->set), s->out);
      } catch (...) {
        fail_with(std::current_exception());
        return;
      }
      std::lock_guard<std::mutex> lk(mu);
      done.emplace(s->seq, s);
      cv.notify_all();
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(cfg.n_threads);
  for (std::size_t i = 0; i < cfg.n_threads; ++i) workers.emplace_back(work_loop);
  std::thread producer(read_loop);

  bool stopped = false;
  std::uint64_t next_seq = 0;
  for (;;) {
    Slot* s = nullptr;
    {
      std::unique_lock<std::mutex> lk(mu);
      cv.wait(lk, [&] {
        return stop || done.count(next_seq) != 0 || (input_done && next_seq == n_read);
      });
      if (stop) break;
      auto it = done.find(next_seq);
      if (it == done.end()) break;   // every set consumed
      s = it->second;
      done.erase(it);
    }
    bool go = false;
    try {
      go = consume(static_cast<const Set&>(s->set), s->out);
    } catch (...) {
      fail_with(std::current_exception());
      break;
    }
    ++next_seq;
    std::lock_guard<std::mutex> lk(mu);
    if (!go) {
      stopped = true;
      break;
    }
    free_q.push_back(s);
    cv.notify_all();
  }

  {
    std::lock_guard<std::mutex> lk(mu);
    stop = true;
    cv.notify_all();
  }
  producer.join();
  for (auto& t : workers) t.join();

  if (failure) std::rethrow_exception(failure);
  return !stopped && !reader.error();
}

// Per-record form of read_parallel(): `work(record, data)` fills one `D` per
// record on a worker, `consume(record, data)` sees records in input order on
// the calling thread and stops the run by returning false. `D` values are
// recycled like the outputs of read_parallel().
template <class D, class Reader, class Work, class Consume>
bool read_parallel_records(Reader& reader, const ParallelConfig& cfg, Work work, Consume consume) {
  using Set = typename Reader::Set;
  return read_parallel<std::vector<D>>(
      reader, cfg,
      [&work](const Set& set, std::vector<D>& out) {
        out.resize(set.size());
        std::size_t i = 0;
        for (const auto& r : set) work(r, out[i++]);
      },
      [&consume](const Set& set, std::vector<D>& out) {
        std::size_t i = 0;
        for (const auto& r : set) {
          if (!consume(r, out[i++])) return false;
        }
        return true;
      });
}

}
