#ifndef IDCHECK_SIG_INT_WAITER_H_
#define IDCHECK_SIG_INT_WAITER_H_

#include <pthread.h>
#include <signal.h>

// Blocks SIGINT for the calling thread (and every thread it starts later) and
// lets one thread wait for it with sigwait(). No signal handler is installed.
class SigIntWaiter {
 public:
  // Construct on the main thread before any other thread is started.
  SigIntWaiter() {
    sigemptyset(&set_);
    sigaddset(&set_, SIGINT);
    pthread_sigmask(SIG_BLOCK, &set_, &previous_);
  }

  ~SigIntWaiter() {
    pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
  }

  SigIntWaiter(const SigIntWaiter&) = delete;
  SigIntWaiter& operator=(const SigIntWaiter&) = delete;

  // Blocks until SIGINT is delivered. Returns false if sigwait() failed.
  bool Wait() const {
    int signal_number = 0;
    return sigwait(&set_, &signal_number) == 0 && signal_number == SIGINT;
  }

 private:
  sigset_t set_;
  sigset_t previous_;
};

#endif  // IDCHECK_SIG_INT_WAITER_H_
