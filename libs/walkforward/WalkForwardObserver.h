// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include "ValidationWindow.h"
#include "WindowResult.h"

namespace wfvalidator
{
  /**
   * @brief Receives window state transitions while a run is in progress.
   *
   * Calls may come from worker threads, but the engine never delivers two
   * notifications at the same time, so implementations need no locking of
   * their own. Notifications for one window arrive in transition order.
   * An exception thrown from onWindowStateChange is logged by the engine
   * and otherwise ignored; it does not fail the window or the run.
   */
  class IWalkForwardObserver
  {
  public:
    virtual ~IWalkForwardObserver() = default;

    virtual void onWindowStateChange(const ValidationWindow& window,
				     WindowState newState) = 0;
  };

  // Default observer; ignores every notification
  class NullWalkForwardObserver : public IWalkForwardObserver
  {
  public:
    void onWindowStateChange(const ValidationWindow&, WindowState) override
    {}
  };
}
