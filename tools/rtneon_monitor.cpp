//Connects to a Neon companion device (discovered, or given as host [port]), prints its status and
// the rate of every requested sensor once per second.
//
//  rtneon_monitor [-c config.json] [-t seconds] [-s gaze,scene,imu,...] [host [port]]

#include <cstdio>
#include <cstdlib>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <rtneon.hpp>
#include <utilities.hpp>
#include <Timer.hpp>

using namespace nlohmann;

static void usage( const char* prog )
{
  fprintf(stderr, "usage: %s [-c config.json] [-t seconds] [-s sensor,sensor,...] [host [port]]\n", prog);
  fprintf(stderr, "  sensors: gaze scene eye_left eye_right imu eye_events audio (default gaze)\n");
}

int main( int argc, char** argv )
{
  std::string cfgfname;
  double runsec = 10.0;
  std::vector<std::string> sensornames = { "gaze" };
  std::vector<std::string> positional;

  for( int i=1; i<argc; ++i )
    {
      std::string a(argv[i]);
      if( (a == "-c" || a == "-t" || a == "-s") && i+1 >= argc )
	{
	  usage( argv[0] );
	  return 1;
	}
      if( a == "-c" ) { cfgfname = argv[++i]; }
      else if( a == "-t" ) { runsec = std::atof( argv[++i] ); }
      else if( a == "-s" ) { sensornames = split_string( argv[++i], ',' ); }
      else if( a == "-h" || a == "--help" ) { usage( argv[0] ); return 0; }
      else { positional.push_back( a ); }
    }

  std::vector<sensor_kind> kinds;
  for( const auto& n : sensornames )
    {
      auto k = sensor_kind_from_str( n );
      if( !k )
	{
	  fprintf(stderr, "Unknown sensor [%s]\n", n.c_str());
	  usage( argv[0] );
	  return 1;
	}
      kinds.push_back( *k );
    }

  try
    {
      session_config cfg;
      if( !cfgfname.empty() )
	{
	  cfg = load_session_config( cfgfname );
	}

      std::unique_ptr<sync_device> dev;
      if( positional.empty() )
	{
	  fprintf(stdout, "Looking for a device...\n");
	  dev = discover_one_device( 10.0, cfg );
	  if( !dev )
	    {
	      fprintf(stderr, "No device found\n");
	      return 1;
	    }
	}
      else
	{
	  device_endpoint ep( positional[0], positional.size() > 1 ? std::atoi( positional[1].c_str() ) : RTNEON_DEFAULT_API_PORT );
	  dev = std::make_unique<sync_device>( ep, cfg );
	}

      fprintf(stdout, "Connected: %s\n", dev->endpoint().tostr().c_str());
      fprintf(stdout, "  phone [%s] battery %d%% (%s)  glasses [%s]  scene cam [%s]\n",
	      dev->phone_name().c_str(), dev->battery_level_percent(), dev->battery_state().c_str(),
	      dev->serial_number_glasses().c_str(), dev->serial_number_scene_cam().c_str());

      try
	{
	  auto off = dev->estimate_time_offset();
	  if( off )
	    {
	      fprintf(stdout, "  clock offset %ld ns (+- %ld ns)\n", (long)off->estimate_ns, (long)off->uncertainty_ns);
	    }
	}
      catch( const device_error& e )
	{
	  fprintf(stderr, "  no clock offset: %s\n", e.what());
	}

      for( auto k : kinds )
	{
	  dev->streaming_start( k );
	}

      std::map<sensor_kind, size_t> counts;
      Timer total;
      Timer persec;
      while( total.elapsed() < runsec )
	{
	  for( auto k : kinds )
	    {
	      auto s = dev->receive( k, 0.01 );
	      if( !s )
		{
		  continue;
		}
	      ++counts[k];
	      if( k == sensor_kind::GAZE && counts[k] == 1 )
		{
		  const gaze_datum* g = (*s)->gaze();
		  fprintf(stdout, "  first gaze (%f, %f) worn=%d at local %ld\n", g->x, g->y, (int)g->worn, (long)(*s)->local_ts_ns);
		}
	    }

	  if( persec.elapsed() >= 1.0 )
	    {
	      std::string line;
	      for( auto k : kinds )
		{
		  line += std::string(sensor_kind_str(k)) + "=" + std::to_string(counts[k]) + " ";
		  counts[k] = 0;
		}
	      auto st = dev->status();
	      fprintf(stdout, "[%5.1lf] %s| %s\n", total.elapsed(), line.c_str(), st ? st->tostr().c_str() : "no status");
	      persec.reset();
	    }
	}

      dev->close();
    }
  catch( const device_error& e )
    {
      fprintf(stderr, "Device error: %s\n", e.what());
      return 1;
    }

  return 0;
}
