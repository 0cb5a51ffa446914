#ifndef UNITS_HPP
#define UNITS_HPP

#include <cctype>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <string>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <boost/units/base_units/imperial/inch.hpp>
#include <boost/units/base_units/metric/minute.hpp>
#include <boost/units/io.hpp>
#include <boost/units/quantity.hpp>
#include <boost/units/systems/si.hpp>

class units_parse_exception : public std::exception {
 public:
  explicit units_parse_exception(const std::string& message) : message(message) {}
  units_parse_exception(const std::string& wanted, const std::string& text) :
      message("Can't get " + wanted + " from: " + text) {}

  virtual const char* what() const throw() {
    return message.c_str();
  }

 private:
  std::string message;
};

// Splits an option value like "3000 mm/min" into a number followed by unit
// words.  Every read skips leading blanks.
class UnitLexer {
 public:
  explicit UnitLexer(const std::string& text) : text(text), cursor(0) {}

  void skip_blanks() {
    while (cursor < text.size() && std::isspace(static_cast<unsigned char>(text[cursor]))) {
      cursor++;
    }
  }

  double number() {
    skip_blanks();
    const size_t start = cursor;
    while (cursor < text.size() &&
           (std::isdigit(static_cast<unsigned char>(text[cursor])) ||
            text[cursor] == '.' || text[cursor] == '-' || text[cursor] == '+')) {
      cursor++;
    }
    const std::string digits = text.substr(start, cursor - start);
    try {
      return boost::lexical_cast<double>(digits);
    } catch (const boost::bad_lexical_cast&) {
      throw units_parse_exception("number", digits);
    }
  }

  std::string word() {
    skip_blanks();
    const size_t start = cursor;
    while (cursor < text.size() && std::isalpha(static_cast<unsigned char>(text[cursor]))) {
      cursor++;
    }
    return text.substr(start, cursor - start);
  }

  // Accepts "/" or "per" between a numerator and a denominator unit.
  void division() {
    skip_blanks();
    if (text.compare(cursor, 1, "/") == 0) {
      cursor += 1;
    } else if (text.compare(cursor, 3, "per") == 0) {
      cursor += 3;
    } else {
      throw units_parse_exception("division", text.substr(cursor));
    }
  }

  bool done() {
    skip_blanks();
    return cursor == text.size();
  }

 private:
  const std::string text;
  size_t cursor;
};

inline bool is_one_of(const std::string& word, std::initializer_list<const char*> names) {
  for (const char* name : names) {
    if (word == name) {
      return true;
    }
  }
  return false;
}

const boost::units::quantity<boost::units::si::length> millimeter(boost::units::si::meter / 1000.0);
const boost::units::quantity<boost::units::si::length> inch(1 * boost::units::imperial::inch_base_unit::unit_type());
const boost::units::quantity<boost::units::si::time> minute(1 * boost::units::metric::minute_base_unit::unit_type());

// A number read from the command line, optionally followed by its units.
// A bare number is taken in the unit the accessor asks for, scaled by the
// accessor's factor.
template <typename dimension_t>
class Quantity {
 public:
  typedef boost::units::quantity<dimension_t> quantity;
  typedef dimension_t dimension;

  Quantity(double value = 0, boost::optional<quantity> unit = boost::none) : value(value), unit(unit) {}

  friend std::ostream& operator<<(std::ostream& out, const Quantity& q) {
    if (q.unit) {
      out << q.value * *q.unit;
    } else {
      out << q.value;
    }
    return out;
  }

 protected:
  double convert(quantity wanted, double factor) const {
    if (!unit) {
      return value * factor;
    }
    return value * (*unit) / wanted;
  }

 private:
  double value;
  boost::optional<quantity> unit;
};

class Length : public Quantity<boost::units::si::length> {
 public:
  Length(double value = 0, boost::optional<quantity> unit = boost::none) : Quantity(value, unit) {}

  double asMillimeter(double factor = 1) const {
    return convert(millimeter, factor);
  }

  static quantity read_unit(UnitLexer& lexer) {
    const std::string word = lexer.word();
    if (is_one_of(word, {"mm", "millimeter", "millimeters"})) {
      return millimeter;
    } else if (is_one_of(word, {"cm", "centimeter", "centimeters"})) {
      return 10.0 * millimeter;
    } else if (is_one_of(word, {"m", "meter", "meters"})) {
      return 1.0 * boost::units::si::meter;
    } else if (is_one_of(word, {"in", "inch", "inches"})) {
      return inch;
    }
    throw units_parse_exception("length units", word);
  }
};

class Time : public Quantity<boost::units::si::time> {
 public:
  Time(double value = 0, boost::optional<quantity> unit = boost::none) : Quantity(value, unit) {}

  double asSecond(double factor = 1) const {
    return convert(1.0 * boost::units::si::second, factor);
  }
  double asMillisecond(double factor = 1000) const {
    return convert(boost::units::si::second / 1000.0, factor);
  }

  static quantity read_unit(UnitLexer& lexer) {
    const std::string word = lexer.word();
    if (is_one_of(word, {"s", "second", "seconds"})) {
      return 1.0 * boost::units::si::second;
    } else if (is_one_of(word, {"ms", "millis", "millisecond", "milliseconds"})) {
      return boost::units::si::second / 1000.0;
    } else if (is_one_of(word, {"min", "mins", "minute", "minutes"})) {
      return minute;
    }
    throw units_parse_exception("time units", word);
  }
};

class Velocity : public Quantity<boost::units::si::velocity> {
 public:
  Velocity(double value = 0, boost::optional<quantity> unit = boost::none) : Quantity(value, unit) {}

  double asMillimeterPerMinute(double factor = 1) const {
    return convert(millimeter / minute, factor);
  }

  // "mm/min" or "mm per min".
  static quantity read_unit(UnitLexer& lexer) {
    const Length::quantity distance = Length::read_unit(lexer);
    lexer.division();
    const Time::quantity duration = Time::read_unit(lexer);
    return distance / duration;
  }
};

// Throws po::invalid_option_value so that a bad unit is reported like any
// other bad option value.
template <typename quantity_t>
quantity_t parse_unit(const std::string& text) {
  UnitLexer lexer(text);
  boost::optional<typename quantity_t::quantity> unit;
  double value;
  try {
    value = lexer.number();
    if (!lexer.done()) {
      unit = quantity_t::read_unit(lexer);
    }
  } catch (const units_parse_exception& e) {
    throw boost::program_options::invalid_option_value("While parsing \"" + text + "\": " + e.what());
  }
  if (!lexer.done()) {
    throw boost::program_options::invalid_option_value("While parsing \"" + text + "\": Extra characters at end of option");
  }
  return quantity_t(value, unit);
}

inline std::istream& operator>>(std::istream& in, Length& length) {
  length = parse_unit<Length>(std::string(std::istreambuf_iterator<char>(in), {}));
  return in;
}

inline std::istream& operator>>(std::istream& in, Time& time) {
  time = parse_unit<Time>(std::string(std::istreambuf_iterator<char>(in), {}));
  return in;
}

inline std::istream& operator>>(std::istream& in, Velocity& velocity) {
  velocity = parse_unit<Velocity>(std::string(std::istreambuf_iterator<char>(in), {}));
  return in;
}

#endif // UNITS_HPP
