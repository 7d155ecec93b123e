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

#include <map>
#include <atomic>
#include <memory>
#include <cstdlib>
#include <chrono>
#include <string>
#include <vector>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <boost/program_options.hpp>

#include "SpecUtils/StringAlgo.h"
#include "SpecUtils/Filesystem.h"

#include "SpecFuse/Rubric.h"
#include "SpecFuse/SpectralId.h"
#include "SpecFuse/FeatureStore.h"
#include "SpecFuse/CandidateGenerator.h"

using namespace std;


namespace
{
  /** Parses "label=value" prior overrides; the label may itself contain '=' signs. */
  map<string,double> parse_priors( const vector<string> &args )
  {
    map<string,double> priors;
    for( const string &arg : args )
    {
      const size_t pos = arg.rfind( '=' );
      if( (pos == string::npos) || (pos == 0) || ((pos + 1) == arg.size()) )
        throw runtime_error( "Invalid prior '" + arg + "'; expected form is label=log_prior" );

      string label = arg.substr( 0, pos );
      string valstr = arg.substr( pos + 1 );
      SpecUtils::trim( label );
      SpecUtils::trim( valstr );

      double value = 0.0;
      if( !SpecUtils::parse_double( valstr.c_str(), valstr.size(), value ) )
        throw runtime_error( "Invalid log-prior value '" + valstr + "' for '" + label + "'" );

      if( priors.count(label) )
        throw runtime_error( "Prior for '" + label + "' given more than once" );

      priors[label] = value;
    }//for( const string &arg : args )

    return priors;
  }//parse_priors(...)
}//namespace


int main( int argc, char *argv[] )
{
  namespace po = boost::program_options;

  string ini_file_path, features_path, catalog_path, rubric_path, output_path, session_id, dataset_id;
  vector<string> whitelist, blacklist, prior_args;
  unsigned long long seed = 0;
  size_t num_threads = 0;
  bool print_explain = false, print_xml = false, overwrite_output_file = false;

  po::options_description cl_desc( "Allowed options" );
  cl_desc.add_options()
  ("help,h",  "Produce help message")
  ("ini-file,i", po::value<std::string>(&ini_file_path)->default_value(""),
   "Path to INI file that can specify command line option defaults.\n"
   "If not specified, will look for \"SpecFuse_batch.ini\" in the current directory.")
  ("features,f", po::value<std::string>(&features_path),
   "The <SpectralFeatures> XML document with the observed spectra and features.")
  ("catalog,c", po::value<std::string>(&catalog_path),
   "The <CandidateCatalog> XML document with detected-element gates, user constraints,"
   " and candidate definitions with their templates.")
  ("rubric,r", po::value<std::string>(&rubric_path),
   "The <Rubric> XML document with all weights and thresholds.  If not specified, uses"
   " \"SpecFuse_resources/default_rubric.xml\".")
  ("seed", po::value<unsigned long long>(&seed)->default_value(0),
   "Seed recorded with the results.")
  ("threads", po::value<size_t>(&num_threads)->default_value(0),
   "Number of scoring threads; 0 uses one per logical core.")
  ("session", po::value<std::string>(&session_id)->default_value(""),
   "Session identifier recorded on the results and evidence graphs.")
  ("dataset", po::value<std::string>(&dataset_id)->default_value(""),
   "Dataset identifier recorded on the results and evidence graphs.")
  ("whitelist", po::value<vector<std::string>>(&whitelist)->multitoken(),
   "Candidate labels to keep even if a rule would drop them; added to the catalogs whitelist.")
  ("blacklist", po::value<vector<std::string>>(&blacklist)->multitoken(),
   "Candidate labels to always drop; added to the catalogs blacklist.")
  ("prior", po::value<vector<std::string>>(&prior_args)->multitoken(),
   "Log-prior overrides of the form label=value.")
  ("output,o", po::value<std::string>(&output_path)->default_value(""),
   "File to write the <IdentifyResult> XML document to.")
  ("overwrite-output-file", po::value<bool>(&overwrite_output_file)->implicit_value(true)->default_value(false),
   "Allows overwriting the output file.")
  ("print", po::value<bool>(&print_xml)->implicit_value(true)->default_value(false),
   "Print the results XML to stdout.")
  ("explain", po::value<bool>(&print_explain)->implicit_value(true)->default_value(false),
   "Print the explanation table of each hypothesis to stdout.")
  ;

  po::variables_map cl_vm;
  try
  {
    po::parsed_options parsed_opts
      = po::command_line_parser(argc,argv)
       .options(cl_desc)
       .run();

    po::store( parsed_opts, cl_vm );

    if( ini_file_path.empty() && cl_vm.count("ini-file") )
      ini_file_path = cl_vm["ini-file"].as<string>();

    if( ini_file_path.empty() && SpecUtils::is_file("SpecFuse_batch.ini") )
      ini_file_path = "SpecFuse_batch.ini";

    if( !ini_file_path.empty() )
    {
      ifstream input( ini_file_path.c_str() );
      if( !input )
        throw runtime_error( "Could not open config file '" + ini_file_path + "'" );

      // Values already given on the command line are not overwritten
      po::store( po::parse_config_file( input, cl_desc, true ), cl_vm );
      std::cout << "Using settings from '" << ini_file_path << "'" << endl;
    }//if( !ini_file_path.empty() )

    po::notify( cl_vm );
  }catch( std::exception &e )
  {
    std::cerr << "Command line argument error: " << e.what() << std::endl << std::endl;
    std::cout << cl_desc << std::endl;
    return 1;
  }//try catch

  if( cl_vm.count("help") )
  {
    std::cout << "Executable compiled on " << __DATE__ << std::endl;
    std::cout << "Available command-line options for SpecFuse batch identification are:\n";
    std::cout << cl_desc << std::endl;
    return EXIT_SUCCESS;
  }//if( cl_vm.count("help") )

#if( SpecFuse_PERFORM_DEVELOPER_CHECKS )
  std::cout << "Developer tests are being performed" << std::endl;
#endif

  bool successful = true;

  try
  {
    if( features_path.empty() )
      throw runtime_error( "You must specify a features file ('--features')." );

    if( catalog_path.empty() )
      throw runtime_error( "You must specify a candidate catalog file ('--catalog')." );

    if( rubric_path.empty() )
      rubric_path = SpecUtils::append_path( "SpecFuse_resources", "default_rubric.xml" );

    if( !output_path.empty() && SpecUtils::is_file(output_path) && !overwrite_output_file )
      throw runtime_error( "Output file '" + output_path + "' already exists; specify"
                           " '--overwrite-output-file' to overwrite it." );

    const map<string,double> priors = parse_priors( prior_args );

    const auto start_time = std::chrono::steady_clock::now();

    std::cout << "Loading rubric from '" << rubric_path << "'" << endl;
    const Rubric rubric = Rubric::load( rubric_path );

    std::cout << "Loading features from '" << features_path << "'" << endl;
    const FeatureStore store = FeatureStore::load( features_path );

    std::cout << "Loading candidate catalog from '" << catalog_path << "'" << endl;
    CandidateGenerator::CandidateCatalog catalog = CandidateGenerator::CandidateCatalog::load( catalog_path );
    catalog.constraints.whitelist.insert( begin(whitelist), end(whitelist) );
    catalog.constraints.blacklist.insert( begin(blacklist), end(blacklist) );

    std::cout << "Scoring " << catalog.candidates.size() << " candidates against "
              << store.num_features_added() << " features" << endl;

    SpectralId::IdentifyOptions options;
    options.num_threads = num_threads;
    options.cancel = make_shared<std::atomic_bool>( false );
    options.session_id = session_id;
    options.dataset_id = dataset_id;

    const SpectralId::IdentifyResult result = SpectralId::identify( store, catalog.candidates, catalog.gates,
                                                                    catalog.constraints, priors, rubric,
                                                                    static_cast<uint64_t>(seed), options );

    const auto end_time = std::chrono::steady_clock::now();
    const double elapsed_ms = std::chrono::duration<double, std::milli>( end_time - start_time ).count();

    std::cout << "Run status: " << SpectralId::to_str(result.status) << " (" << result.status_message << ")"
              << ", took " << SpecUtils::printCompact( elapsed_ms, 4 ) << " ms" << endl;

    for( const string &warning : result.warnings )
      std::cout << "  Warning: " << warning << endl;

    for( const CandidateGenerator::DroppedCandidate &drop : result.dropped )
      std::cout << "  Dropped '" << drop.label << "' (" << drop.rule << "): " << drop.reason << endl;

    for( const auto &hyp : result.hypotheses )
    {
      std::cout << "  " << hyp->id << " '" << hyp->label << "': G=" << SpecUtils::printCompact(hyp->score, 5)
                << ", tier " << FusionEngine::to_str(hyp->tier) << endl;
    }

    if( print_explain )
    {
      for( const auto &hyp : result.hypotheses )
      {
        std::cout << endl;
        SpectralId::explain( *hyp ).print( std::cout );
      }
    }//if( print_explain )

    const string xml = result.to_xml_string();

    if( print_xml )
      std::cout << endl << xml << endl;

    if( !output_path.empty() )
    {
      ofstream output( output_path.c_str(), ios::out | ios::binary );
      if( !output )
        throw runtime_error( "Could not open '" + output_path + "' for writing." );

      output << xml;
      if( !output )
        throw runtime_error( "Error writing '" + output_path + "'." );

      std::cout << "Wrote results to '" << output_path << "'" << endl;
    }//if( !output_path.empty() )
  }catch( std::exception &e )
  {
    successful = false;
    cerr << "Error performing identification: " << e.what() << endl;
  }

  cout << "Done with batch identification." << endl;

  return successful ? EXIT_SUCCESS : EXIT_FAILURE;
}//int main( int argc, char *argv[] )
