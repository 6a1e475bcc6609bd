#include <set>
#include <string>
#include <vector>
#include <variant>

#define BOOST_TEST_MODULE NMRSynthesis_suite
#include <boost/test/included/unit_test.hpp>

#include "spectra.hpp"
#include "spectra/nmr.hpp"

using namespace std;
using namespace specfact;
using namespace specfact::spectra;
using namespace boost::unit_test;

namespace
{
  NMRSpectrum synthesizeNMR( const string &smiles, Nucleus nucleus, uint64_t seed )
  {
    const NMRSynthesizer synth( nucleus );
    const SmilesPatternDetector detector;
    RandomSource rng( seed );
    return std::get<NMRSpectrum>( synth.synthesize( detector.detect( smiles ), smiles, rng ) );
  }
  
  const NMRPeak *findLabel( const NMRSpectrum &spectrum, const string &label )
  {
    for( const NMRPeak &p : spectrum.peaks )
    {
      if( p.label == label )
        return &p;
    }
    return nullptr;
  }
  
  // The returned pointer refers into the spectrum; a temporary would leave it dangling.
  const NMRPeak *findLabel( NMRSpectrum &&spectrum, const string &label ) = delete;
}//namespace


BOOST_AUTO_TEST_CASE( SynthesizerNames )
{
  BOOST_CHECK_EQUAL( NMRSynthesizer( Nucleus::H1 ).getName(), "nmr_1h" );
  BOOST_CHECK_EQUAL( NMRSynthesizer( Nucleus::C13 ).getName(), "nmr_13c" );
  BOOST_CHECK( NMRSynthesizer( Nucleus::C13 ).getModality() == Modality::NMR );
  
  const SpectrumResult empty = NMRSynthesizer( Nucleus::C13 ).emptyResult();
  BOOST_REQUIRE( std::holds_alternative<NMRSpectrum>( empty ) );
  BOOST_CHECK( std::get<NMRSpectrum>( empty ).nucleus == Nucleus::C13 );
  BOOST_CHECK( std::get<NMRSpectrum>( empty ).peaks.empty() );
}//BOOST_AUTO_TEST_CASE( SynthesizerNames )


BOOST_AUTO_TEST_CASE( AcetoneProton )
{
  for( uint64_t seed = 1; seed <= 20; ++seed )
  {
    const NMRSpectrum nmr = synthesizeNMR( "CC(=O)C", Nucleus::H1, seed );
    BOOST_CHECK( nmr.nucleus == Nucleus::H1 );
    BOOST_REQUIRE_EQUAL( nmr.peaks.size(), 1u );
    
    const NMRPeak &methyl = nmr.peaks[0];
    BOOST_CHECK_EQUAL( methyl.label, "CH3" );
    BOOST_CHECK_EQUAL( methyl.multiplicity, "s" );
    BOOST_CHECK( methyl.shift >= 2.05 && methyl.shift <= 2.15 );
    BOOST_CHECK_EQUAL( methyl.intensity, 1.0 );
    BOOST_CHECK( methyl.atomIds == vector<int>({1, 2}) );
    BOOST_CHECK( !methyl.hasCoupling() );
  }
}//BOOST_AUTO_TEST_CASE( AcetoneProton )


BOOST_AUTO_TEST_CASE( AcetoneCarbon )
{
  for( uint64_t seed = 1; seed <= 20; ++seed )
  {
    const NMRSpectrum nmr = synthesizeNMR( "CC(=O)C", Nucleus::C13, seed );
    BOOST_REQUIRE_EQUAL( nmr.peaks.size(), 2u );
    
    BOOST_CHECK_EQUAL( nmr.peaks[0].label, "C=O" );
    BOOST_CHECK( nmr.peaks[0].shift >= 205.0 && nmr.peaks[0].shift <= 207.0 );
    BOOST_CHECK_EQUAL( nmr.peaks[0].intensity, 0.4 );
    BOOST_CHECK( nmr.peaks[0].atomIds == vector<int>({1}) );
    
    BOOST_CHECK_EQUAL( nmr.peaks[1].label, "CH3" );
    BOOST_CHECK( nmr.peaks[1].shift >= 29.5 && nmr.peaks[1].shift <= 30.5 );
    BOOST_CHECK( nmr.peaks[1].atomIds == vector<int>({2, 3}) );
  }
}//BOOST_AUTO_TEST_CASE( AcetoneCarbon )


BOOST_AUTO_TEST_CASE( EthanolProton )
{
  const NMRSpectrum nmr = synthesizeNMR( "CCO", Nucleus::H1, 11 );
  BOOST_REQUIRE_EQUAL( nmr.peaks.size(), 4u );
  
  const NMRPeak *oh = findLabel( nmr, "Alcohol/Phenol OH" );
  BOOST_REQUIRE( oh );
  BOOST_CHECK_EQUAL( oh->multiplicity, "bs" );
  BOOST_CHECK( oh->shift >= 3.0 && oh->shift < 5.5 );
  
  BOOST_CHECK( findLabel( nmr, "H alpha to heteroatom/C=O" ) );
  BOOST_CHECK( findLabel( nmr, "Aliphatic CHx" ) );
  BOOST_CHECK( findLabel( nmr, "Aliphatic CHx (upfield)" ) );
  
  // Each generic peak carries its own simulated atom
  set<int> ids;
  for( const NMRPeak &p : nmr.peaks )
  {
    BOOST_CHECK_EQUAL( p.atomIds.size(), 1u );
    ids.insert( p.atomIds.begin(), p.atomIds.end() );
  }
  BOOST_CHECK( ids == set<int>({1, 2, 3, 4}) );
}//BOOST_AUTO_TEST_CASE( EthanolProton )


BOOST_AUTO_TEST_CASE( FunctionalGroupShifts )
{
  for( uint64_t seed = 1; seed <= 10; ++seed )
  {
    const NMRSpectrum aldehydeSpectrum = synthesizeNMR( "CC(=O)H", Nucleus::H1, seed );
    const NMRPeak *aldehyde = findLabel( aldehydeSpectrum, "Aldehyde H" );
    BOOST_REQUIRE( aldehyde );
    BOOST_CHECK( aldehyde->shift >= 9.5 && aldehyde->shift < 10.0 );
    
    const NMRSpectrum acid = synthesizeNMR( "CC(=O)OH", Nucleus::H1, seed );
    const NMRPeak *acidOH = findLabel( acid, "Acid OH" );
    BOOST_REQUIRE( acidOH );
    BOOST_CHECK( acidOH->shift >= 10.0 && acidOH->shift < 12.0 );
    BOOST_CHECK( !findLabel( acid, "Alcohol/Phenol OH" ) );
    
    const NMRSpectrum amideSpectrum = synthesizeNMR( "CC(=O)N", Nucleus::C13, seed );
    const NMRPeak *amide = findLabel( amideSpectrum, "C=O (Amide)" );
    BOOST_REQUIRE( amide );
    BOOST_CHECK( amide->shift >= 160.0 && amide->shift < 175.0 );
    
    const NMRSpectrum benzene = synthesizeNMR( "c1ccccc1", Nucleus::C13, seed );
    BOOST_REQUIRE_EQUAL( benzene.peaks.size(), 2u );
    BOOST_CHECK_EQUAL( benzene.peaks[0].label, "Aromatic C" );
    BOOST_CHECK_EQUAL( benzene.peaks[1].label, "Aromatic C" );
    BOOST_CHECK( benzene.peaks[0].shift >= benzene.peaks[1].shift );
    BOOST_CHECK( benzene.peaks[0].shift >= 115.0 && benzene.peaks[0].shift < 148.0 );
    BOOST_CHECK( benzene.peaks[1].shift >= 115.0 && benzene.peaks[1].shift < 148.0 );
  }
}//BOOST_AUTO_TEST_CASE( FunctionalGroupShifts )


BOOST_AUTO_TEST_CASE( SortedDescending )
{
  const vector<string> inputs{ "C", "CCO", "CC(=O)OC", "c1ccccc1CC=C", "C#CCN", "CC(=O)N", "nonsense" };
  for( const string &smiles : inputs )
  {
    for( Nucleus nucleus : {Nucleus::H1, Nucleus::C13} )
    {
      for( uint64_t seed = 1; seed <= 5; ++seed )
      {
        const NMRSpectrum nmr = synthesizeNMR( smiles, nucleus, seed );
        BOOST_CHECK( nmr.nucleus == nucleus );
        for( size_t i = 1; i < nmr.peaks.size(); ++i )
          BOOST_CHECK( nmr.peaks[i-1].shift >= nmr.peaks[i].shift );
        for( const NMRPeak &p : nmr.peaks )
          BOOST_CHECK_EQUAL( p.multiplicity.empty(), false );
      }
    }
  }
}//BOOST_AUTO_TEST_CASE( SortedDescending )


BOOST_AUTO_TEST_CASE( NoFeaturesNoPeaks )
{
  RandomSource rng( 3 );
  BOOST_CHECK( NMRSynthesizer::protonPeaks( FeatureFlags{}, "", rng ).empty() );
  BOOST_CHECK( NMRSynthesizer::carbonPeaks( FeatureFlags{}, rng ).empty() );
}//BOOST_AUTO_TEST_CASE( NoFeaturesNoPeaks )
