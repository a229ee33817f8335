#include <cmath>
#include <limits>

#include <gtest/gtest.h>

#include "Errors.h"
#include "Matrix.hpp"
#include "TestUtils.h"

using numeric::Matrix;


TEST(Matrix, ReadFromFile)
{
	TempDirectory tmp;
	const std::string file = tmp.join("counts.dat");
	writeFile(file,
		"# Number of samples per window\n"
		"0  3  0\n"
		"\n"
		"1  0  12\n"
	);

	const auto counts = Matrix<int>::FromFile(file);
	ASSERT_EQ( counts.getNumRows(), 2 );
	ASSERT_EQ( counts.getNumCols(), 3 );
	EXPECT_EQ( counts(0,1), 3 );
	EXPECT_EQ( counts(1,0), 1 );
	EXPECT_EQ( counts(1,2), 12 );
	EXPECT_EQ( counts.sum(), 16 );
}


TEST(Matrix, ReadErrors)
{
	TempDirectory tmp;

	const std::string ragged = tmp.join("ragged.dat");
	writeFile(ragged, "0 1 2\n3 4\n");
	EXPECT_THROW( Matrix<int>::FromFile(ragged), ParseError );

	const std::string not_ints = tmp.join("not_ints.dat");
	writeFile(not_ints, "0 1.5\n");
	EXPECT_THROW( Matrix<int>::FromFile(not_ints), ParseError );

	try {
		Matrix<int>::FromFile( tmp.join("missing.dat") );
		FAIL() << "expected MissingFileError";
	}
	catch ( const MissingFileError& err ) {
		EXPECT_EQ( err.getFile(), tmp.join("missing.dat") );
	}
}


TEST(Matrix, SaveAndSwap)
{
	TempDirectory tmp;

	Matrix<double> pmf(2, 2);
	pmf.assign( std::numeric_limits<double>::infinity() );
	pmf(0,1) = -2.5;

	const std::string file = tmp.join("pmf.out");
	pmf.save(file, "PMF");

	const auto lines = readLines(file);
	ASSERT_EQ( lines.size(), 3u );
	EXPECT_EQ( lines[0], "# PMF" );
	EXPECT_EQ( lines[1], "inf -2.5" );
	EXPECT_EQ( lines[2], "inf inf" );

	const Matrix<double>::Int2 shape = {{ 1, 3 }};
	Matrix<double> other(shape, 0.0);
	other.swap(pmf);
	EXPECT_EQ( pmf.getNumCols(), 3 );
	EXPECT_EQ( other.getNumRows(), 2 );
	EXPECT_EQ( other(0,1), -2.5 );
}


TEST(Matrix, SavedValuesReadBackExactly)
{
	TempDirectory tmp;

	Matrix<double> pmf(2, 3);
	pmf(0,0) = 0.1;
	pmf(0,1) = 1.0/3.0;
	pmf(0,2) = -2.718281828459045;
	pmf(1,0) = 1.0e-12;
	pmf(1,1) = 123456.78901234567;
	pmf(1,2) = std::numeric_limits<double>::infinity();

	const std::string file = tmp.join("pmf.out");
	pmf.save(file, "PMF");

	const auto saved = Matrix<double>::FromFile(file);
	ASSERT_EQ( saved.getShape(), pmf.getShape() );
	for ( int i=0; i<2; ++i ) {
		for ( int j=0; j<3; ++j ) {
			EXPECT_EQ( saved(i,j), pmf(i,j) ) << "(" << i << "," << j << ")";
		}
	}
}


TEST(Matrix, SaveReportsWriteErrors)
{
	Matrix<double> pmf(2, 2);
	pmf.assign(1.0);

	EXPECT_THROW( pmf.save("/nonexistent/dir/pmf.out"), std::runtime_error );

	// Opens fine, but every write fails
	EXPECT_THROW( pmf.save("/dev/full", "PMF"), std::runtime_error );
}
