// Copyright (C) 2018-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "mainloop.hpp"

#include <glog/logging.h>

#include <atomic>
#include <csignal>
#include <cstring>

#include <signal.h>

namespace fhetrade
{

namespace
{

/** Set by the signal handler when SIGTERM or SIGINT arrives.  */
volatile std::sig_atomic_t interruptReceived = 0;

/** Whether some MainLoop instance currently owns the signal handlers.  */
std::atomic<bool> signalsClaimed(false);

/** The signals that stop the main loop.  */
constexpr int STOP_SIGNALS[] = {SIGTERM, SIGINT};

/**
 * Installs our handler for the stop signals while in scope, and restores
 * the previous handlers afterwards.
 */
class SignalScope
{

private:

  struct sigaction previous[2];

public:

  explicit SignalScope (void (*handler) (int))
  {
    CHECK (!signalsClaimed.exchange (true))
        << "Another main loop is already running";
    interruptReceived = 0;

    struct sigaction act;
    std::memset (&act, 0, sizeof (act));
    act.sa_handler = handler;
    sigemptyset (&act.sa_mask);

    for (unsigned i = 0; i < 2; ++i)
      if (sigaction (STOP_SIGNALS[i], &act, &previous[i]) != 0)
        LOG (FATAL) << "Could not install handler for signal "
                    << STOP_SIGNALS[i];
  }

  ~SignalScope ()
  {
    for (unsigned i = 0; i < 2; ++i)
      if (sigaction (STOP_SIGNALS[i], &previous[i], nullptr) != 0)
        LOG (ERROR) << "Could not restore handler for signal "
                    << STOP_SIGNALS[i];

    signalsClaimed = false;
  }

  SignalScope () = delete;
  SignalScope (const SignalScope&) = delete;
  void operator= (const SignalScope&) = delete;

};

/**
 * Runs a stop function when going out of scope.
 */
class StopOnExit
{

private:

  const MainLoop::Functor& stop;

public:

  explicit StopOnExit (const MainLoop::Functor& s)
    : stop(s)
  {}

  ~StopOnExit ()
  {
    stop ();
  }

  StopOnExit () = delete;
  StopOnExit (const StopOnExit&) = delete;
  void operator= (const StopOnExit&) = delete;

};

} // anonymous namespace

MainLoop::~MainLoop ()
{
  CHECK (!IsRunning ()) << "Main loop is still running, cannot destroy it";
}

bool
MainLoop::IsRunning () const
{
  std::lock_guard<std::mutex> lock(mut);
  return running;
}

void
MainLoop::HandleInterrupt (const int signum)
{
  interruptReceived = 1;
}

bool
MainLoop::ConsumeInterrupt ()
{
  if (interruptReceived == 0)
    return false;

  interruptReceived = 0;
  return true;
}

void
MainLoop::Run (const Functor& start, const Functor& stop)
{
  {
    std::lock_guard<std::mutex> lock(mut);
    CHECK (!running) << "Main loop is already running, cannot start it again";
    running = true;
    shouldStop = false;
  }

  {
    SignalScope signals(&MainLoop::HandleInterrupt);

    LOG (INFO) << "Starting main loop";
    StopOnExit runStop(stop);
    start ();

    /* The lock is only held while waiting, so that the start and stop
       functions can call into Stop (e.g. from RPC threads).  */
    std::unique_lock<std::mutex> lock(mut);
    while (!shouldStop)
      {
        cv.wait_for (lock, SIGNAL_POLL);
        if (ConsumeInterrupt ())
          {
            LOG (INFO) << "Received stop signal";
            shouldStop = true;
          }
      }
    lock.unlock ();

    LOG (INFO) << "Stopping main loop";
  }

  std::lock_guard<std::mutex> lock(mut);
  running = false;
}

void
MainLoop::Stop ()
{
  std::lock_guard<std::mutex> lock(mut);
  shouldStop = true;
  cv.notify_all ();
}

} // namespace fhetrade
