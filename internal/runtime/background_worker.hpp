#pragma once

namespace audit::runtime {

// Long-running component started after the server is built and stopped
// before it is torn down.
class BackgroundWorker {
public:
  virtual ~BackgroundWorker() = default;

  virtual void Start() = 0;
  virtual void Stop() = 0;
};

} // namespace audit::runtime
