// Copyright (C) 2018-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TRADED_MAINLOOP_HPP
#define TRADED_MAINLOOP_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace fhetrade
{

/**
 * Keeps the daemon (and with it the RPC server) alive until it is told
 * to stop, either through Stop (called by the "stop" RPC method) or by
 * SIGTERM / SIGINT.
 *
 * Only one instance can be running at a time, since signals are
 * process-wide.
 */
class MainLoop
{

private:

  /** Interval at which the loop checks for received signals.  */
  static constexpr auto SIGNAL_POLL = std::chrono::milliseconds (100);

  bool running = false;
  bool shouldStop = false;

  mutable std::mutex mut;
  std::condition_variable cv;

  /**
   * Signal handler, which just records that a stop was requested.  It is
   * picked up by the running loop on its next poll.
   */
  static void HandleInterrupt (int signum);

  /**
   * Returns true (and clears the flag) if a stop signal has been received.
   */
  static bool ConsumeInterrupt ();

  friend class MainLoopTests;

public:

  using Functor = std::function<void ()>;

  MainLoop () = default;
  ~MainLoop ();

  MainLoop (const MainLoop&) = delete;
  void operator= (const MainLoop&) = delete;

  bool IsRunning () const;

  /**
   * Calls start, then blocks until the loop is stopped and calls stop.
   * The stop function is also called if start throws.
   */
  void Run (const Functor& start, const Functor& stop);

  /**
   * Requests the running loop to return.  This may be called from within
   * the start function.
   */
  void Stop ();

};

} // namespace fhetrade

#endif // TRADED_MAINLOOP_HPP
