#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#define BOOST_TEST_MODULE CsvIO_suite
#include <boost/test/included/unit_test.hpp>

#include <rapidjson/document.h>

#include "io.hpp"
#include "spectra.hpp"

using namespace std;
using namespace specfact;
using namespace boost::unit_test;

namespace
{
  std::filesystem::path tempFile( const string &name )
  {
    return std::filesystem::temp_directory_path() / ("specfact_" + name);
  }
  
  void writeText( const std::filesystem::path &path, const string &text )
  {
    std::ofstream out( path, std::ios::out | std::ios::trunc );
    out << text;
  }
  
  vector<string> readLines( const std::filesystem::path &path )
  {
    vector<string> lines;
    std::ifstream in( path );
    string line;
    while( std::getline( in, line ) )
      lines.push_back( line );
    return lines;
  }
}//namespace


BOOST_AUTO_TEST_CASE( ParseCsvLine )
{
  vector<string> cells = CsvIO::parseCsvLine( "a,\"b,c\",d", "," );
  BOOST_REQUIRE_EQUAL( cells.size(), 3u );
  BOOST_CHECK_EQUAL( cells[1], "b,c" );
  
  cells = CsvIO::parseCsvLine( "\"he said \"\"hi\"\"\",x", "," );
  BOOST_REQUIRE_EQUAL( cells.size(), 2u );
  BOOST_CHECK_EQUAL( cells[0], "he said \"hi\"" );
  
  cells = CsvIO::parseCsvLine( "a,", "," );
  BOOST_REQUIRE_EQUAL( cells.size(), 2u );
  BOOST_CHECK_EQUAL( cells[1], "" );
  
  cells = CsvIO::parseCsvLine( "CCO;ethanol\r", ";" );
  BOOST_REQUIRE_EQUAL( cells.size(), 2u );
  BOOST_CHECK_EQUAL( cells[1], "ethanol" );
  
  BOOST_CHECK( CsvIO::parseCsvLine( "", "," ).empty() );
}//BOOST_AUTO_TEST_CASE( ParseCsvLine )


BOOST_AUTO_TEST_CASE( QuotingHelpers )
{
  BOOST_CHECK_EQUAL( CsvIO::trimQuotes( "  \"CCO\" " ), "CCO" );
  BOOST_CHECK_EQUAL( CsvIO::trimQuotes( "\"\"" ), "" );
  
  BOOST_CHECK_EQUAL( CsvIO::quoteCell( "CC(=O)C", "," ), "CC(=O)C" );
  BOOST_CHECK_EQUAL( CsvIO::quoteCell( "C-H stretch (sp3)", "," ), "\"C-H stretch (sp3)\"" );
  BOOST_CHECK_EQUAL( CsvIO::quoteCell( "a,b", "," ), "\"a,b\"" );
  BOOST_CHECK_EQUAL( CsvIO::quoteCell( "x\"y", "," ), "\"x\"\"y\"" );
}//BOOST_AUTO_TEST_CASE( QuotingHelpers )


BOOST_AUTO_TEST_CASE( MissingInputAndColumn )
{
  try
  {
    CsvIO csv( tempFile( "does_not_exist.csv" ).string(), "", ",", "SMILES", true );
    BOOST_ERROR( "expected an exception for a missing input file" );
  }catch( const SpectrumException &e )
  {
    BOOST_CHECK( e.getCode() == ErrorCode::IO_ERROR );
  }
  
  const auto input = tempFile( "no_smiles_column.csv" );
  writeText( input, "id,structure\n1,CCO\n" );
  try
  {
    CsvIO csv( input.string(), "", ",", "SMILES", true );
    BOOST_ERROR( "expected an exception for a missing SMILES column" );
  }catch( const SpectrumException &e )
  {
    BOOST_CHECK( e.getCode() == ErrorCode::PARSE_ERROR );
  }
  std::filesystem::remove( input );
}//BOOST_AUTO_TEST_CASE( MissingInputAndColumn )


BOOST_AUTO_TEST_CASE( BatchRoundTrip )
{
  const auto input = tempFile( "batch_in.csv" );
  const auto output = tempFile( "batch_out.csv" );
  writeText( input, "id,SMILES\n1,CC(=O)C\n2,\n\n3,C\n" );
  
  {
    CsvIO csv( input.string(), output.string(), ",", "SMILES", true );
    BOOST_CHECK_EQUAL( csv.getSmilesIndex(), 1 );
    BOOST_CHECK_EQUAL( csv.getHeaderColumns().size(), 2u );
    
    CsvIO::LineReader reader = csv.createLineReader();
    BOOST_CHECK_EQUAL( reader.getEstimatedLines(), 3u );
    
    CsvIO::ResultWriter writer = csv.createResultWriter();
    
    RowBatch batch;
    BOOST_REQUIRE( reader.readBatch( batch, 2 ) );
    BOOST_CHECK_EQUAL( batch.firstRow, 0u );
    BOOST_REQUIRE_EQUAL( batch.size(), 2u );
    BOOST_CHECK_EQUAL( batch.descriptors[0], "CC(=O)C" );
    BOOST_CHECK_EQUAL( batch.descriptors[1], "" );
    BOOST_CHECK( reader.getProgress() > 0.0 );
    
    const SpectrumFactory factory;
    auto synthesizeBatch = [&factory]( const RowBatch &rows ) {
      vector<SpectrumResult> results;
      for( size_t i = 0; i < rows.size(); ++i )
      {
        spectra::RandomSource rng = spectra::RandomSource::forStream( 42, rows.firstRow + i );
        results.push_back( factory.synthesize( rows.descriptors[i], Modality::NMR, Nucleus::H1, rng ) );
      }
      return results;
    };
    
    BOOST_CHECK( writer.writeBatch( batch, synthesizeBatch( batch ) ) );
    
    // the blank line is skipped, not counted
    BOOST_REQUIRE( reader.readBatch( batch, 2 ) );
    BOOST_CHECK_EQUAL( batch.firstRow, 2u );
    BOOST_REQUIRE_EQUAL( batch.size(), 1u );
    BOOST_CHECK_EQUAL( batch.descriptors[0], "C" );
    BOOST_CHECK( writer.writeBatch( batch, synthesizeBatch( batch ) ) );
    
    BOOST_CHECK( !reader.readBatch( batch, 2 ) );
    BOOST_CHECK( batch.empty() );
    BOOST_CHECK_CLOSE( reader.getProgress(), 1.0, 1.0E-9 );
    
    BOOST_CHECK( writer.writeBatch( batch, {} ) );
    BOOST_CHECK( !writer.writeBatch( batch, vector<SpectrumResult>( 1 ) ) );
    
    // acetone: 1 row, empty descriptor: 1 NA row, methane: 2 rows
    BOOST_CHECK_EQUAL( writer.getRowsWritten(), 4u );
  }
  
  const vector<string> lines = readLines( output );
  BOOST_REQUIRE_EQUAL( lines.size(), 5u );
  BOOST_CHECK_EQUAL( lines[0], "id,SMILES,modality,x,y,label,multiplicity,coupling,atom_ids" );
  
  const vector<string> acetone = CsvIO::parseCsvLine( lines[1], "," );
  BOOST_REQUIRE_EQUAL( acetone.size(), 9u );
  BOOST_CHECK_EQUAL( acetone[0], "1" );
  BOOST_CHECK_EQUAL( acetone[1], "CC(=O)C" );
  BOOST_CHECK_EQUAL( acetone[2], "nmr_1h" );
  BOOST_CHECK_EQUAL( acetone[5], "CH3" );
  BOOST_CHECK_EQUAL( acetone[6], "s" );
  BOOST_CHECK_EQUAL( acetone[7], "NA" );
  BOOST_CHECK_EQUAL( acetone[8], "1;2" );
  const double shift = std::stod( acetone[3] );
  BOOST_CHECK( shift >= 2.0 && shift <= 2.2 );
  
  const vector<string> empty = CsvIO::parseCsvLine( lines[2], "," );
  BOOST_REQUIRE_EQUAL( empty.size(), 9u );
  BOOST_CHECK_EQUAL( empty[3], "NA" );
  
  const vector<string> methaneA = CsvIO::parseCsvLine( lines[3], "," );
  const vector<string> methaneB = CsvIO::parseCsvLine( lines[4], "," );
  BOOST_REQUIRE_EQUAL( methaneA.size(), 9u );
  BOOST_REQUIRE_EQUAL( methaneB.size(), 9u );
  BOOST_CHECK_EQUAL( methaneA[0], "3" );
  BOOST_CHECK_EQUAL( methaneB[0], "3" );
  BOOST_CHECK( methaneA[5] == "Aliphatic CHx (upfield)" || methaneB[5] == "Aliphatic CHx (upfield)" );
  
  std::filesystem::remove( input );
  std::filesystem::remove( output );
}//BOOST_AUTO_TEST_CASE( BatchRoundTrip )


BOOST_AUTO_TEST_CASE( HeaderlessInput )
{
  const auto input = tempFile( "headerless.csv" );
  writeText( input, "first;CCO\nsecond;c1ccccc1\n" );
  
  CsvIO csv( input.string(), tempFile( "headerless_out.csv" ).string(), ";", "1", false );
  BOOST_CHECK_EQUAL( csv.getSmilesIndex(), 1 );
  
  CsvIO::LineReader reader = csv.createLineReader();
  RowBatch batch;
  BOOST_REQUIRE( reader.readBatch( batch, 10 ) );
  BOOST_REQUIRE_EQUAL( batch.size(), 2u );
  BOOST_CHECK_EQUAL( batch.descriptors[1], "c1ccccc1" );
  BOOST_CHECK_EQUAL( batch.cells[0][0], "first" );
  
  std::filesystem::remove( input );
}//BOOST_AUTO_TEST_CASE( HeaderlessInput )


BOOST_AUTO_TEST_CASE( JsonDocument )
{
  const SpectrumFactory factory;
  spectra::RandomSource rng( 77 );
  
  const SpectrumResult ir = factory.synthesize( "CC(=O)C", Modality::IR, rng );
  rapidjson::Document doc;
  doc.Parse( spectrumToJson( "CC(=O)C", ir, 77 ).c_str() );
  BOOST_REQUIRE( !doc.HasParseError() );
  BOOST_CHECK_EQUAL( string( doc["descriptor"].GetString() ), "CC(=O)C" );
  BOOST_CHECK_EQUAL( string( doc["modality"].GetString() ), "ir" );
  BOOST_CHECK_EQUAL( doc["seed"].GetUint64(), 77u );
  BOOST_REQUIRE( doc["peaks"].IsArray() );
  BOOST_CHECK_EQUAL( doc["peaks"].Size(), peakCount( ir ) );
  BOOST_CHECK_EQUAL( doc["curve"]["x"].Size(), 7201u );
  BOOST_CHECK_EQUAL( doc["curve"]["y"].Size(), 7201u );
  
  rapidjson::Document noCurve;
  noCurve.Parse( spectrumToJson( "CC(=O)C", ir, 77, false ).c_str() );
  BOOST_CHECK( !noCurve.HasMember( "curve" ) );
  
  const SpectrumResult nmr = factory.synthesize( "CC(=O)C", Modality::NMR, Nucleus::C13, rng );
  rapidjson::Document nmrDoc;
  nmrDoc.Parse( spectrumToJson( "CC(=O)C", nmr, 77 ).c_str() );
  BOOST_REQUIRE( !nmrDoc.HasParseError() );
  BOOST_CHECK_EQUAL( string( nmrDoc["nucleus"].GetString() ), "13C" );
  BOOST_REQUIRE_EQUAL( nmrDoc["peaks"].Size(), 2u );
  BOOST_CHECK_EQUAL( string( nmrDoc["peaks"][0]["label"].GetString() ), "C=O" );
  BOOST_CHECK_EQUAL( nmrDoc["peaks"][1]["atomIds"].Size(), 2u );
}//BOOST_AUTO_TEST_CASE( JsonDocument )


BOOST_AUTO_TEST_CASE( NmrEnvelope )
{
  NMRSpectrum spectrum;
  spectrum.nucleus = Nucleus::H1;
  spectrum.peaks.push_back( {7.26, 0.6, "m", 0.0, "Aromatic H", {1}} );
  spectrum.peaks.push_back( {1.2, 2.0, "m", 0.0, "Aliphatic CHx", {2}} );
  
  const Curve envelope = renderNmrEnvelope( spectrum );
  BOOST_REQUIRE_EQUAL( envelope.size(), 1000u );
  BOOST_CHECK_SMALL( envelope.front().x, 1.0E-12 );
  BOOST_CHECK_CLOSE( envelope.back().x, 12.0, 1.0E-9 );
  
  double maxY = 0.0, yNearAromatic = 0.0;
  for( const SpectrumPoint &p : envelope )
  {
    maxY = std::max( maxY, p.y );
    if( std::abs( p.x - 7.26 ) < 0.01 )
      yNearAromatic = std::max( yNearAromatic, p.y );
  }
  BOOST_CHECK( maxY <= 1.0 );
  BOOST_CHECK( yNearAromatic > 0.3 );
  
  spectrum.nucleus = Nucleus::C13;
  BOOST_CHECK_CLOSE( renderNmrEnvelope( spectrum ).back().x, 220.0, 1.0E-9 );
}//BOOST_AUTO_TEST_CASE( NmrEnvelope )


BOOST_AUTO_TEST_CASE( CurveCsv )
{
  const SpectrumFactory factory;
  spectra::RandomSource rng( 3 );
  const auto path = tempFile( "uv_curve.csv" );
  
  writeCurveCsv( path.string(), factory.synthesize( "c1ccccc1", Modality::UV_VIS, rng ) );
  const vector<string> lines = readLines( path );
  BOOST_REQUIRE_EQUAL( lines.size(), 1202u );
  BOOST_CHECK_EQUAL( lines[0], "wavelength_nm,absorbance" );
  BOOST_CHECK_EQUAL( CsvIO::parseCsvLine( lines[1], "," )[0], "200.0000" );
  
  std::filesystem::remove( path );
  
  BOOST_CHECK_THROW( writeCurveCsv( "/nonexistent_dir/specfact/curve.csv",
                                    factory.synthesize( "C", Modality::IR, rng ) ), SpectrumException );
}//BOOST_AUTO_TEST_CASE( CurveCsv )
