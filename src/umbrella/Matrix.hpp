#ifndef NUMERIC_MATRIX_HPP
#define NUMERIC_MATRIX_HPP

#include <array>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "Assert.hpp"
#include "Errors.h"
#include "OpenMP.h"
#include "StringTools.h"


namespace numeric {

// Matrix: A flexible 2-dimensional array
// - Implemented using a 1-dimensional array (default: std::vector)
// - Row-major: for lambda grids, rows run along x and columns along y
template<typename T, class Vector = std::vector<T>>
class Matrix
{
 public:
  static_assert(std::is_same<T, typename Vector::value_type>::value, "type mismatch");


  //----- Typedefs and Constants -----//

  static constexpr int N_DIM = 2;
  using Int2 = std::array<int,N_DIM>;
  
  using value_type = T;
  using size_type  = std::size_t;

  using reference       = value_type&;
  using const_reference = const value_type&;

  using iterator       = typename Vector::iterator;
  using const_iterator = typename Vector::const_iterator;


  //----- Constructors -----//

	// Empty
  Matrix() = default;

	// With size
  Matrix(const int num_rows, const int num_cols) {
    resize(num_rows, num_cols);
  }

	// With size
  Matrix(const Int2& shape) {
    resize(shape);
  }

	// Fill with constant value
  Matrix(const Int2& shape, const T& value) {
    assign(shape, value);
  }

  // Read from a file
  // - Whitespace-delimited table; blank lines and lines starting with '#' are skipped
  Matrix(const std::string& file_name);

  // Read from file (named constructor)
  static Matrix FromFile(const std::string& file_name) {
    return Matrix(file_name);
  }


  //----- Size Management -----//

  // Set size
  // - Does not preserve stored data
  void resize(const int num_rows, const int num_cols) {
    FANCY_DEBUG_ASSERT(num_rows >= 0, "invalid num rows: " << num_rows);
    FANCY_DEBUG_ASSERT(num_cols >= 0, "invalid num cols: " << num_cols);

    data_.resize(num_rows*num_cols);
    num_rows_ = num_rows;
    num_cols_ = num_cols;
  }

	// Sets dimensions
	// - Does not preserve stored data
  void resize(const Int2& shape) {
    resize(shape[ROW], shape[COL]);
  }

  // Get sizes
  Int2 getShape() const {
    return {{ num_rows_, num_cols_ }}; 
  }

  int getNumRows() const {
    return num_rows_;
  }

  int getNumCols() const {
    return num_cols_;
  }

  std::size_t size() const noexcept {
    return data_.size();
  }


  //----- Data Management -----//

  // Assign all entries to a particular value
  void assign(const T& value) {
    data_.assign( data_.size(), value );
  }

  void assign(const Int2& shape, const T& value) {
    this->resize(shape);
    this->assign(value);
  }

  // Exchanges contents (including shape) with another matrix
  void swap(Matrix& other) noexcept {
    data_.swap(other.data_);
    std::swap(num_rows_, other.num_rows_);
    std::swap(num_cols_, other.num_cols_);
  }


  //----- Data access -----//

  // Individual elements
  T&       operator()(const int i, const int j);
  const T& operator()(const int i, const int j) const;

  T& operator()(const Int2& indices) {
    return (*this)(indices[ROW], indices[COL]);
  }
  const T& operator()(const Int2& indices) const {
    return (*this)(indices[ROW], indices[COL]);
  }

  // Iterate over all elements in the matrix
  iterator begin() noexcept {
    return data_.begin();
  }
  iterator end() noexcept {
    return data_.end();
  }
  const_iterator begin() const noexcept {
    return data_.cbegin();
  }
  const_iterator end() const noexcept {
    return data_.cend();
  }


  //----- Array Properties -----//

  // Sum of all elements
  T sum() const {
    const int len = this->data_.size();
    T s = 0;

    #pragma omp parallel for \
      default(shared) schedule(static,10) reduction(+:s)
    for ( int i=0; i<len; ++i ) {
      s += data_[i];
    }

    return s;
  }


  //----- Misc. -----//

  // Saves the matrix to given file
  void save(
    const std::string& file_name,
    const std::string& header = ""
  ) const;


 protected:
  static constexpr int ROW = 0;
  static constexpr int COL = 1;

  // Map from 2D indices to 1D index of underlying array
  int getLinearIndex(const int i, const int j) const noexcept;

  // Adds a row of values (number of values must match number of columns)
  void addRow(const Vector& values) {
    int num_values = values.size();
    FANCY_ASSERT( num_values == num_cols_, "size mismatch" );

    data_.insert( data_.end(), values.begin(), values.end() );
    ++num_rows_;
  }

  // Tokenize a line into values
  // - Returns false if a token is not a value of type T
  static bool parseLine(const std::string& line, Vector& values) {
    values.clear();
    std::stringstream ss(line);

    std::string token;
    T value;
    while ( ss >> token ) {
      if ( ! parseToken(token, value) ) {
        return false;
      }
      values.push_back(value);
    }

    return true;
  }

  // Reals go through StringTools so that "inf" and "nan" are accepted
  static bool parseToken(const std::string& token, double& value) {
    return StringTools::stringToDouble(token, value);
  }

  template<typename U>
  static bool parseToken(const std::string& token, U& value) {
    std::stringstream token_ss(token);
    return ( (token_ss >> value) && token_ss.eof() );
  }

 private:
  Vector data_;  // underlying 1D array
  int    num_rows_ = 0;
  int    num_cols_ = 0;
};



template<typename T, typename V>
Matrix<T,V>::Matrix(const std::string& file_name)
{
  std::ifstream ifs(file_name);
  if ( ! ifs.is_open() ) {
    throw MissingFileError(file_name, "unable to open file: " + file_name);
  }

  std::string line;
  V values;
  int line_number = 0;
  while ( std::getline(ifs, line) ) {
    ++line_number;

    std::stringstream ss(line);
    std::string first_token;
    if ( ! (ss >> first_token) || first_token[0] == '#' ) {
      continue;
    }

    if ( ! parseLine(line, values) ) {
      std::stringstream err_ss;
      err_ss << file_name << ":" << line_number << ": unable to parse line \"" << line << "\"";
      throw ParseError( err_ss.str() );
    }

    // The first row of data sets the number of columns
    if ( num_rows_ == 0 ) {
      resize(0, values.size());
    }
    else if ( static_cast<int>(values.size()) != num_cols_ ) {
      std::stringstream err_ss;
      err_ss << file_name << ":" << line_number << ": expected " << num_cols_
             << " columns, found " << values.size();
      throw ParseError( err_ss.str() );
    }

    addRow(values);
  }
}


template<typename T, typename V>
inline
T& Matrix<T,V>::operator()(const int i, const int j)
{
  FANCY_DEBUG_ASSERT( i >= 0 && i < num_rows_ && j >= 0 && j < num_cols_,
                      "indices (" << i << "," << j << ") are out of bounds "
                      << "(" << num_rows_ << "," << num_cols_ << ")" );
  return data_[ getLinearIndex(i,j) ];
}


template<typename T, typename V>
inline
const T& Matrix<T,V>::operator()(const int i, const int j) const
{
  FANCY_DEBUG_ASSERT( i >= 0 && i < num_rows_ && j >= 0 && j < num_cols_,
                      "indices (" << i << "," << j << ") are out of bounds "
                      << "(" << num_rows_ << "," << num_cols_ << ")" );
  return data_[ getLinearIndex(i,j) ];
}


template<typename T, typename V>
inline
int Matrix<T,V>::getLinearIndex(const int i, const int j) const noexcept
{
  return i*num_cols_ + j;
}


// Save to file
template<typename T, typename V>
void Matrix<T,V>::save(
  const std::string& file_name, const std::string& header
) const
{
  std::ofstream ofs(file_name);
  FANCY_ASSERT( ofs, "error attempting to write to file: " << file_name );

  // Enough digits for values to read back unchanged
  ofs << std::setprecision( std::numeric_limits<T>::max_digits10 );

  if ( ! header.empty() )  {
    ofs << "# " << header << "\n";
  }

  for ( int i=0; i<num_rows_; ++i ) {
    for ( int j=0; j<num_cols_; ++j ) {
      if ( j > 0 ) {
        ofs << " ";
      }
      ofs << (*this)(i,j);
    }
    ofs << "\n";
  }

  ofs.close();
  FANCY_ASSERT( ! ofs.fail(), "error writing to file: " << file_name );
}

} // end namespace numeric

#endif // ifndef NUMERIC_MATRIX_HPP
