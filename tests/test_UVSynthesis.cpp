#include <algorithm>
#include <cmath>
#include <string>
#include <vector>
#include <variant>

#define BOOST_TEST_MODULE UVSynthesis_suite
#include <boost/test/included/unit_test.hpp>

#include "spectra.hpp"
#include "spectra/uv.hpp"

using namespace std;
using namespace specfact;
using namespace specfact::spectra;
using namespace boost::unit_test;

namespace
{
  UVSpectrum synthesizeUV( const string &smiles, uint64_t seed )
  {
    const UVSynthesizer synth;
    const SmilesPatternDetector detector;
    RandomSource rng( seed );
    return std::get<UVSpectrum>( synth.synthesize( detector.detect( smiles ), smiles, rng ) );
  }
}//namespace


BOOST_AUTO_TEST_CASE( CurveShapeAndOrdering )
{
  const vector<string> inputs{ "C", "CC(=O)C", "c1ccccc1", "C=CC=C", "CC(=O)N", "CC(=O)OC", "Oc1ccccc1C=O" };
  for( const string &smiles : inputs )
  {
    for( uint64_t seed = 1; seed <= 5; ++seed )
    {
      const UVSpectrum uv = synthesizeUV( smiles, seed );
      BOOST_REQUIRE_EQUAL( uv.curve.size(), 1201u );
      BOOST_CHECK_CLOSE( uv.curve.front().x, 200.0, 1.0E-9 );
      BOOST_CHECK_CLOSE( uv.curve.back().x, 800.0, 1.0E-9 );
      
      double minY = uv.curve.front().y;
      for( const SpectrumPoint &p : uv.curve )
        minY = std::min( minY, p.y );
      BOOST_CHECK( minY >= 0.0 );
      
      for( size_t i = 1; i < uv.peaks.size(); ++i )
      {
        BOOST_CHECK( uv.peaks[i-1].x <= uv.peaks[i].x );
        BOOST_CHECK( uv.peaks[i].x - uv.peaks[i-1].x >= 10.0 );
      }
    }
  }
}//BOOST_AUTO_TEST_CASE( CurveShapeAndOrdering )


BOOST_AUTO_TEST_CASE( AromaticBands )
{
  for( uint64_t seed = 1; seed <= 20; ++seed )
  {
    const UVSpectrum uv = synthesizeUV( "c1ccccc1", seed );
    
    bool aromatic = false;
    for( const LabeledPeak &p : uv.peaks )
    {
      if( p.label.find( "aromatic" ) != string::npos && p.x >= 190.0 && p.x <= 280.0 )
        aromatic = true;
    }
    BOOST_CHECK( aromatic );
  }
}//BOOST_AUTO_TEST_CASE( AromaticBands )


BOOST_AUTO_TEST_CASE( CarbonylBand )
{
  for( uint64_t seed = 1; seed <= 20; ++seed )
  {
    const UVSpectrum uv = synthesizeUV( "CC(=O)C", seed );
    BOOST_REQUIRE( !uv.peaks.empty() );
    
    const LabeledPeak &strongest = *std::max_element( uv.peaks.begin(), uv.peaks.end(),
      []( const LabeledPeak &a, const LabeledPeak &b ){ return a.y < b.y; } );
    BOOST_CHECK_EQUAL( strongest.label, "n→π* (carbonyl)" );
    BOOST_CHECK( strongest.x >= 240.0 && strongest.x <= 330.0 );
  }
}//BOOST_AUTO_TEST_CASE( CarbonylBand )


BOOST_AUTO_TEST_CASE( NoChromophoreNoPeaks )
{
  for( uint64_t seed = 1; seed <= 10; ++seed )
  {
    const UVSpectrum uv = synthesizeUV( "C", seed );
    BOOST_CHECK( uv.peaks.empty() );
    for( const SpectrumPoint &p : uv.curve )
      BOOST_CHECK_SMALL( p.y - 0.03, 0.0050001 );
  }
}//BOOST_AUTO_TEST_CASE( NoChromophoreNoPeaks )


BOOST_AUTO_TEST_CASE( TransitionTable )
{
  FeatureFlags flags;
  flags.hasAromatic = true;
  flags.hasCarbonyl = true;
  flags.hasAmide = true;
  
  RandomSource rng( 7 );
  const vector<CharacteristicPeak> transitions = UVSynthesizer::buildTransitions( flags, rng );
  BOOST_REQUIRE_EQUAL( transitions.size(), 4u );
  
  BOOST_CHECK_EQUAL( transitions[0].label, "π→π* (aromatic, B band)" );
  BOOST_CHECK( transitions[0].center >= 255.0 && transitions[0].center < 270.0 );
  BOOST_CHECK_EQUAL( transitions[1].label, "π→π* (aromatic, E band)" );
  BOOST_CHECK( transitions[1].center >= 205.0 && transitions[1].center < 220.0 );
  BOOST_CHECK_EQUAL( transitions[2].label, "n→π* (carbonyl)" );
  BOOST_CHECK( transitions[2].targetAmplitude >= 0.1 && transitions[2].targetAmplitude < 0.3 );
  BOOST_CHECK_EQUAL( transitions[3].label, "π→π* (amide)" );
  BOOST_CHECK( transitions[3].width >= 18.0 && transitions[3].width < 25.0 );
  
  BOOST_CHECK( UVSynthesizer::buildTransitions( FeatureFlags{}, rng ).empty() );
}//BOOST_AUTO_TEST_CASE( TransitionTable )
