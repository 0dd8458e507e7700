// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_CANCELLATION_TOKEN_H
#define __WFV_CANCELLATION_TOKEN_H 1

#include <atomic>

namespace wfvalidator
{
  /**
   * @brief Cooperative cancellation flag shared between a caller and a run.
   *
   * The engine checks the flag before every backtest call and while waiting
   * on one. A call already inside the adapter is never interrupted.
   */
  class CancellationToken
  {
  public:
    CancellationToken()
      : mCancelled(false)
    {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel()
    {
      mCancelled.store(true, std::memory_order_release);
    }

    bool isCancelled() const
    {
      return mCancelled.load(std::memory_order_acquire);
    }

  private:
    std::atomic<bool> mCancelled;
  };
}

#endif
