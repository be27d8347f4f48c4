/*
 * SphMesh: Spherical Meshes and Geodesic Bounded Regions
 * Copyright (c) 2013-2016 by Elizabeth Fischer
 * 
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * 
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 * 
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef SPHMESH_ERROR_HPP
#define SPHMESH_ERROR_HPP

#include <exception>
#include <string>
#include <utility>
#include <boost/format.hpp>

/** @defgroup sphmesh sphmesh.hpp
@brief Basic stuff common to all sphmesh */
namespace sphmesh {

/** Base class of everything thrown by SphMesh.  Every validation
failure is raised before any partial mesh is returned. */
class Exception : public std::exception
{
    std::string _what;
public:
    Exception() : _what("sphmesh::Exception") {}
    Exception(std::string &&what) : _what(std::move(what)) {}
    Exception(std::string const &what) : _what(what) {}
    Exception(boost::format const &fmt) : _what(fmt.str()) {}
    virtual ~Exception() throw() {}

    virtual const char *what() const throw()
        { return _what.c_str(); }
};

// ---- Caller-data errors
/** x/y (or lon/lat) arrays disagree in length or shape */
class ShapeMismatchError : public Exception
{
public:
    ShapeMismatchError(std::string &&what) : Exception(std::move(what)) {}
    ShapeMismatchError(std::string const &what) : Exception(what) {}
    ShapeMismatchError(boost::format const &fmt) : Exception(fmt) {}
};

/** Too few coordinate values to form a single face */
class InsufficientGeometryError : public Exception
{
public:
    InsufficientGeometryError(std::string &&what) : Exception(std::move(what)) {}
    InsufficientGeometryError(std::string const &what) : Exception(what) {}
    InsufficientGeometryError(boost::format const &fmt) : Exception(fmt) {}
};

/** A (N,2) bounds array whose neighbouring bounds do not abut */
class NonContiguousBoundsError : public Exception
{
public:
    NonContiguousBoundsError(std::string &&what) : Exception(std::move(what)) {}
    NonContiguousBoundsError(std::string const &what) : Exception(what) {}
    NonContiguousBoundsError(boost::format const &fmt) : Exception(fmt) {}
};

/** Connectivity with fewer than 3 vertices in a face */
class DegenerateFaceError : public Exception
{
public:
    DegenerateFaceError(std::string &&what) : Exception(std::move(what)) {}
    DegenerateFaceError(std::string const &what) : Exception(what) {}
    DegenerateFaceError(boost::format const &fmt) : Exception(fmt) {}
};

/** Data whose size matches neither the points nor the faces of a mesh */
class DataSizeMismatchError : public Exception
{
public:
    DataSizeMismatchError(std::string &&what) : Exception(std::move(what)) {}
    DataSizeMismatchError(std::string const &what) : Exception(what) {}
    DataSizeMismatchError(boost::format const &fmt) : Exception(fmt) {}
};

/** Connectivity start index other than 0 or 1 */
class InvalidStartIndexError : public Exception
{
public:
    InvalidStartIndexError(std::string &&what) : Exception(std::move(what)) {}
    InvalidStartIndexError(std::string const &what) : Exception(what) {}
    InvalidStartIndexError(boost::format const &fmt) : Exception(fmt) {}
};

class InvalidPanelError : public Exception
{
public:
    InvalidPanelError(std::string &&what) : Exception(std::move(what)) {}
    InvalidPanelError(std::string const &what) : Exception(what) {}
    InvalidPanelError(boost::format const &fmt) : Exception(fmt) {}
};

class InvalidPreferenceError : public Exception
{
public:
    InvalidPreferenceError(std::string &&what) : Exception(std::move(what)) {}
    InvalidPreferenceError(std::string const &what) : Exception(what) {}
    InvalidPreferenceError(boost::format const &fmt) : Exception(fmt) {}
};

class InvalidEllipsoidError : public Exception
{
public:
    InvalidEllipsoidError(std::string &&what) : Exception(std::move(what)) {}
    InvalidEllipsoidError(std::string const &what) : Exception(what) {}
    InvalidEllipsoidError(boost::format const &fmt) : Exception(fmt) {}
};

// ---- Geometric degeneracy
class InvalidGeometryError : public Exception
{
public:
    InvalidGeometryError(std::string &&what) : Exception(std::move(what)) {}
    InvalidGeometryError(std::string const &what) : Exception(what) {}
    InvalidGeometryError(boost::format const &fmt) : Exception(fmt) {}
};

class NotSphericalError : public Exception
{
public:
    NotSphericalError(std::string &&what) : Exception(std::move(what)) {}
    NotSphericalError(std::string const &what) : Exception(what) {}
    NotSphericalError(boost::format const &fmt) : Exception(fmt) {}
};

class InvalidWedgeError : public Exception
{
public:
    InvalidWedgeError(std::string &&what) : Exception(std::move(what)) {}
    InvalidWedgeError(std::string const &what) : Exception(what) {}
    InvalidWedgeError(boost::format const &fmt) : Exception(fmt) {}
};

class ProjectionError : public Exception
{
public:
    ProjectionError(std::string &&what) : Exception(std::move(what)) {}
    ProjectionError(std::string const &what) : Exception(what) {}
    ProjectionError(boost::format const &fmt) : Exception(fmt) {}
};

// ---- Policy violations
/** Strict "cell" enclosure over a surface with mixed face types */
class MixedFaceTypeError : public Exception
{
public:
    MixedFaceTypeError(std::string &&what) : Exception(std::move(what)) {}
    MixedFaceTypeError(std::string const &what) : Exception(what) {}
    MixedFaceTypeError(boost::format const &fmt) : Exception(fmt) {}
};

/** printf-style handler for internal (non-validation) failures. */
typedef void (*error_ptr) (int retcode, char const *format, ...);

/** Prints to stderr and throws sphmesh::Exception by default; user or
    other library can change if needed. */
extern error_ptr sphmesh_error;

/** Diagnostic output level.  0 = silent. */
extern int verbose;

}   // namespace
/** @} */

#endif // Guard
