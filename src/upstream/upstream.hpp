#pragma once

#include "adaptive/scan_strategy.hpp"
#include "loads/raw_load.hpp"

#include <string>

namespace loadwatch::upstream {

// Source of load batches. FetchBatch() must respect `strategy.timeout_s`; on
// timeout or transport failure it returns false with `error` populated. Any
// partial data left in `loads` is ignored by the scheduler.
class IUpstream {
public:
  virtual ~IUpstream() = default;

  virtual bool FetchBatch(const adaptive::ScanStrategy& strategy, loads::LoadBatch& loads,
                          std::string& error) = 0;
};

// Session lifecycle steps, consumed only by the recovery manager.
class ISessionLifecycle {
public:
  virtual ~ISessionLifecycle() = default;

  virtual bool Teardown(std::string& error) = 0;
  virtual bool Rebuild(std::string& error) = 0;
  virtual bool Authenticate(std::string& error) = 0;
  // One lightweight round trip that proves the rebuilt session works.
  virtual bool Probe(std::string& error) = 0;
};

} // namespace loadwatch::upstream
