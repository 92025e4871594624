#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include <loopcond.hpp>

struct looper
{
  //REV: protected so derived sessions can test/stop their own loop
protected:
  loopcond localloop;
  std::string tag;
  std::mutex startstop_mu;

public:
  looper(const std::string& mytag="")
    : tag(mytag)
  {
    localloop.stop();
  }

  const std::string& gettag() const
  {
    return tag;
  }

  bool islooping() const
  {
    return localloop();
  }

  void startlooping()
  {
    localloop.start();
  }

  void stoplooping()
  {
    localloop.stop();
  }
};
