#if !defined(HUPAI_PYTHON_BINDINGS_HPP_INCLUDE_GUARD)
#define HUPAI_PYTHON_BINDINGS_HPP_INCLUDE_GUARD

#include <boost/python/dict.hpp>
#include <boost/python/list.hpp>
#include <boost/python/tuple.hpp>
#include <boost/python/object.hpp>
#include <boost/python/module.hpp>
#include <boost/python/def.hpp>
#include <string>


namespace Hupai::Python{

boost::python::list parseTiles(std::string const &text);

// `hand` is a dict with the keys `concealed`, `drawn`, `self_quads`, `melds`
// and `bonus`. Tiles are ordinals.
boost::python::dict analyze(boost::python::dict hand);

boost::python::dict score(boost::python::dict hand, long seat, bool self_drawn, long round_wind);

boost::python::list findWinningTiles(boost::python::dict hand);

boost::python::list enumerateChiOptions(boost::python::list concealed, long discarded);

// `candidates` is a list of `(seat, type, chi)` tuples, `chi` being `None`
// or a `(discarded, first, second)` tuple.
boost::python::tuple resolveInterrupt(boost::python::list candidates);

void registerExceptionTranslators();

} // namespace Hupai::Python


BOOST_PYTHON_MODULE(_hupai)
{
  Hupai::Python::registerExceptionTranslators();
  boost::python::def("parse_tiles", &Hupai::Python::parseTiles);
  boost::python::def("analyze", &Hupai::Python::analyze);
  boost::python::def("score", &Hupai::Python::score);
  boost::python::def("find_winning_tiles", &Hupai::Python::findWinningTiles);
  boost::python::def("enumerate_chi_options", &Hupai::Python::enumerateChiOptions);
  boost::python::def("resolve_interrupt", &Hupai::Python::resolveInterrupt);
} // BOOST_PYTHON_MODULE(_hupai)


#endif // !defined(HUPAI_PYTHON_BINDINGS_HPP_INCLUDE_GUARD)
