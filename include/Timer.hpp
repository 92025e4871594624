#pragma once

#include <chrono>

struct Timer
{
private:
  std::chrono::steady_clock::time_point t0;

public:
  Timer()
    : t0(std::chrono::steady_clock::now())
  { }

  void reset()
  {
    t0 = std::chrono::steady_clock::now();
  }

  //seconds
  double elapsed() const
  {
    return std::chrono::duration<double>( std::chrono::steady_clock::now() - t0 ).count();
  }
};
