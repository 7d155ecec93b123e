/* SpecFuse: cross-modal spectral identification and evidence fusion.

 Copyright 2018 National Technology & Engineering Solutions of Sandia, LLC
 (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
 Government retains certain rights in this software.
 For questions contact William Johnson via email at wcjohns@sandia.gov, or
 alternative emails of interspec@sandia.gov.

 This library is free software; you can redistribute it and/or
 modify it under the terms of the GNU Lesser General Public
 License as published by the Free Software Foundation; either
 version 2.1 of the License, or (at your option) any later version.

 This library is distributed in the hope that it will be useful,
 but WITHOUT ANY WARRANTY; without even the implied warranty of
 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 Lesser General Public License for more details.

 You should have received a copy of the GNU Lesser General Public
 License along with this library; if not, write to the Free Software
 Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
 */

#include "SpecFuse_config.h"

#if( SpecFuse_PERFORM_DEVELOPER_CHECKS )

#include <mutex>
#include <ctime>
#include <string>
#include <fstream>
#include <iostream>

using namespace std;


void log_developer_error( const char *location, const char *error )
{
  static std::mutex s_dev_error_log_mutex;

  const time_t now = time( nullptr );
  char timestr[64] = { '\0' };
  struct tm tm_now;
#if( defined(_WIN32) )
  localtime_s( &tm_now, &now );
#else
  localtime_r( &now, &tm_now );
#endif
  strftime( timestr, sizeof(timestr), "%Y-%m-%d %H:%M:%S", &tm_now );

  const string msg = string(timestr) + " " + (location ? location : "") + ": " + (error ? error : "");

  std::lock_guard<std::mutex> lock( s_dev_error_log_mutex );

  cerr << "Developer error: " << msg << endl;

  ofstream output( "developer_errors.log", ios::out | ios::app );
  if( output )
    output << msg << "\n\n";
  else
    cerr << "Failed to open developer_errors.log for writing" << endl;
}//void log_developer_error(...)

#endif //SpecFuse_PERFORM_DEVELOPER_CHECKS
