/**
 * \file inner_prod_vector.hpp
 * \brief header file for InnerProdVector class
 * \version 1.0
 */

#pragma once

#include <math.h>

#include <ostream>
#include <iostream>

#include <boost/numeric/ublas/vector.hpp>

#include "./flow_error.hpp"

using std::cerr;
using std::endl;
namespace ublas = boost::numeric::ublas;

/*!
 * \class InnerProdVector
 * \brief defines a vector of nodal values along the nozzle axis
 *
 * This is simply a front end for ublas::vector<double>, with some
 * additional search and slicing functionality needed to split a
 * nozzle at its throat and at a shock.  Also provides a simplified
 * notation.
 */
class InnerProdVector : public ublas::vector<double> {
 public:

  /*!
   * \brief default constructor, creates an empty vector
   */
  InnerProdVector() : ublas::vector<double>() {}

  /*!
   * \brief constructor, creates and initializes a vector of given size
   * \param[in] size - number of elements in vector
   * \param[in] val - all elements are given value val
   */
  InnerProdVector(const int & size, const double & val = 0.0) :
      ublas::vector<double>(size, val) {}

  /*!
   * \brief constructor, creates a vector from a ublas::vector<double>
   * \param[in] u - ublas vector to initialize vector to
   */
  InnerProdVector(const ublas::vector<double> & u) :
      ublas::vector<double>(u) {}

  /*!
   * \brief constructor, evaluates a ublas vector expression
   * \param[in] ae - expression, e.g. a vector scaled by a constant
   */
  template <class AE>
  InnerProdVector(const ublas::vector_expression<AE> & ae) :
      ublas::vector<double>(ae) {}

  /*!
   * \brief copy constructor
   * \param[in] u - existing vector that we want to copy
   */
  InnerProdVector(const InnerProdVector & u) :
      ublas::vector<double>(static_cast<ublas::vector<double> >(u)) {}

  /*!
   * \brief default destructor
   */
  ~InnerProdVector() {}

  /*!
   * \brief copy assignment
   * \param[in] u - existing vector that we want to copy
   */
  InnerProdVector & operator=(const InnerProdVector & u) {
    ublas::vector<double>::operator=(u);
    return *this;
  }

  /*!
   * \brief assign all elements of a vector the same value
   * \param[in] val - scalar value that we want the elements to be set to
   */
  void operator=(const double & val) {
    ublas::vector<double>::operator=(
        ublas::scalar_vector<double>(size(), val));
  }

  /*!
   * \brief index of the smallest element (first one on ties)
   * \returns the index of the minimum value
   */
  int ArgMin() const {
    if (size() == 0) {
      cerr << "InnerProdVector(ArgMin): vector is empty" << endl;
      throw DomainError("InnerProdVector(ArgMin): vector is empty");
    }
    int imin = 0;
    for (int i = 1; i < size(); i++)
      if (operator()(i) < operator()(imin)) imin = i;
    return imin;
  }

  /*!
   * \brief index of the element nearest to a value within [begin, end)
   * \param[in] val - value being searched for
   * \param[in] begin - first index of the search range
   * \param[in] end - one past the last index of the search range
   * \returns index of the element minimizing |v(i) - val|
   *
   * The result is only as accurate as the spacing between elements;
   * no interpolation between neighbours is attempted.
   */
  int ArgNearest(const double & val, const int & begin,
                 const int & end) const {
    if ( (begin < 0) || (end > size()) || (begin >= end) ) {
      cerr << "InnerProdVector(ArgNearest): invalid range "
           << "[" << begin << ", " << end << ") for size "
           << size() << endl;
      throw DomainError("InnerProdVector(ArgNearest): invalid range");
    }
    int inear = begin;
    double dist = fabs(operator()(begin) - val);
    for (int i = begin+1; i < end; i++) {
      if (fabs(operator()(i) - val) < dist) {
        dist = fabs(operator()(i) - val);
        inear = i;
      }
    }
    return inear;
  }

  /*!
   * \brief copy of the contiguous range [begin, end)
   * \param[in] begin - first index to copy
   * \param[in] end - one past the last index to copy
   * \returns the sub-vector
   */
  InnerProdVector Slice(const int & begin, const int & end) const {
    if ( (begin < 0) || (end > size()) || (begin > end) ) {
      cerr << "InnerProdVector(Slice): invalid range "
           << "[" << begin << ", " << end << ") for size "
           << size() << endl;
      throw DomainError("InnerProdVector(Slice): invalid range");
    }
    InnerProdVector sub(end - begin, 0.0);
    for (int i = begin; i < end; i++)
      sub(i - begin) = operator()(i);
    return sub;
  }

  /*!
   * \brief overwrite the elements starting at begin with those of u
   * \param[in] begin - first index to overwrite
   * \param[in] u - values to copy in
   */
  void SetSlice(const int & begin, const InnerProdVector & u) {
    if ( (begin < 0) || (begin + static_cast<int>(u.size()) > size()) ) {
      cerr << "InnerProdVector(SetSlice): slice of size " << u.size()
           << " at " << begin << " exceeds size " << size() << endl;
      throw DomainError("InnerProdVector(SetSlice): invalid range");
    }
    for (int i = 0; i < u.size(); i++)
      operator()(begin + i) = u(i);
  }
};
