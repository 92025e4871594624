//clock_offset_estimator: echo math, median, EWMA, jump reset, jitter rejection, background probing.

#include <cassert>
#include <cstdio>
#include <memory>
#include <vector>

#include <fake_device.hpp>

static std::vector<echo_measurement> batch( const std::vector<int64_t>& offsets_ms, const int64_t rtt_ms )
{
  std::vector<echo_measurement> res;
  int64_t t = 1700000000000LL;
  for( auto off : offsets_ms )
    {
      echo_measurement m;
      m.client_send_ms = t;
      m.device_ms = t + rtt_ms/2 + off;
      m.client_recv_ms = t + rtt_ms;
      res.push_back( m );
      t += 10;
    }
  return res;
}

int main()
{
  const int64_t MS = 1000000;

  //////////// symmetric round trips recover the offset exactly
  {
    clock_offset_estimator est;
    assert( !est.has_estimate() );
    assert( est.translate( 12345 ) == 12345 );

    fake_echo_source src( 1000, 4 );
    auto off = est.estimate( src );
    assert( off.valid );
    assert( off.estimate_ns == 1000 * MS );
    assert( off.measurements == RTNEON_CLOCK_PROBE_COUNT );
    assert( est.has_estimate() );

    const rtneon_time_ns_t dev = 1700000000123456789LL;
    assert( est.translate( dev ) == dev - 1000 * MS );
    assert( est.to_device( est.translate( dev ) ) == dev );
  }

  //////////// median ignores a single outlier
  {
    clock_offset_estimator est;
    auto off = est.update_from_measurements( batch( { 10, 10, 10, 500, 10 }, 2 ), 1 );
    assert( off.estimate_ns == 10 * MS );

    clock_offset_estimator est2;
    off = est2.update_from_measurements( batch( { 10, 20, 30, 40 }, 2 ), 1 );
    assert( off.estimate_ns == 25 * MS );
  }

  //////////// small changes are smoothed, large ones replace the estimate
  {
    clock_config cfg;
    cfg.ewma_alpha = 0.5;
    cfg.drift_reset_ns = 20 * MS;
    clock_offset_estimator est( cfg );
    est.update_from_measurements( batch( { 100, 100, 100 }, 2 ), 1 );
    assert( est.get().estimate_ns == 100 * MS );

    auto off = est.update_from_measurements( batch( { 110, 110, 110 }, 2 ), 2 );
    assert( off.estimate_ns == 105 * MS );
    assert( !est.wants_early_reprobe() );

    off = est.update_from_measurements( batch( { 500, 500, 500 }, 2 ), 3 );
    assert( off.estimate_ns == 500 * MS );
    assert( est.wants_early_reprobe() );
    assert( off.last_updated_ns == 3 );
  }

  //////////// noisy round trips keep the previous offset and lower confidence
  {
    clock_offset_estimator est;
    fake_echo_source good( 2000, 4 );
    est.estimate( good );
    const double conf = est.get().confidence;
    assert( conf > 0.5 );

    fake_echo_source noisy( 2005, 50, 30 );
    auto off = est.estimate( noisy );
    assert( off.estimate_ns == 2000 * MS );
    assert( off.confidence < conf );
  }

  //////////// failed probes leave the estimate alone
  {
    clock_offset_estimator est;
    fake_echo_source src( 7, 4 );
    src.fail = true;
    auto off = est.estimate( src );
    assert( !off.valid );
    assert( !est.has_estimate() );

    off = est.update_from_measurements( {}, 1 );
    assert( !off.valid );
  }

  //////////// fixed offset
  {
    clock_offset_estimator est;
    est.set_offset( -3 * MS );
    assert( est.has_estimate() );
    assert( est.translate( 0 ) == 3 * MS );
    assert( est.to_device( 3 * MS ) == 0 );
  }

  //////////// background probing starts immediately and stops cleanly
  {
    clock_config cfg;
    cfg.probe_interval_sec = 60;
    clock_offset_estimator est( cfg );
    auto src = std::make_shared<fake_echo_source>( -250, 6 );
    est.start( src );
    assert( wait_until( [&]() { return est.has_estimate(); }, 5.0 ) );
    assert( est.get().estimate_ns == -250 * MS );
    est.stop();
    est.stop();
    assert( src->nprobes == 1 );
  }

  std::puts("clock_offset: ALL TESTS PASSED");
  return 0;
}
