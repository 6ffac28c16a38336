//  autotag
//  Tag substitution for rendered text
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 The autotag authors
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

// JSON for Modern C++
// https://github.com/nlohmann/json
#include <nlohmann/json.hpp>

namespace autotag {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map keeps object properties in declaration order when
  // values are dumped
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Store selected by the first segment of a tag path
  enum class Source { Query, Form, Cookie, Server, Session, Registry, Global };

  // Terminal transform named after "::" in a tag
  enum class PostProcessor { None, Json, PrettyJson, Length, Count, Upper,
    Lower, Unset, Unknown };

namespace internal {

  // Constants defining the tag grammar. This block provides a single
  // location for easy editing to allow for future changes.
  inline constexpr char TAG_OPEN = '<';
  inline constexpr char RAW_MARKER = '~';
  inline constexpr char PATH_DELIMITER = ':';
  inline constexpr char ARGUMENT_DELIMITER = ',';
  inline const std::string TAG_CLOSE = "/>";
  inline const std::string POST_PROCESSOR_PREFIX = "::";

  inline const std::string SOURCE_SESSION = "session";
  inline const std::string SOURCE_FORM = "post";
  inline const std::string SOURCE_QUERY = "get";
  inline const std::string SOURCE_COOKIE = "cookie";
  inline const std::string SOURCE_SERVER = "server";
  inline const std::string SOURCE_REGISTRY = "registry";

  // Context document sections (see load_context)
  inline const std::string SECTION_GLOBALS = "globals";

  inline const std::string RECURSION_MARKER = "*RECURSION*";

  // Defaults for Limits
  inline constexpr std::size_t DEFAULT_MAX_TAG_LENGTH = 4096;
  inline constexpr std::size_t DEFAULT_MAX_NESTING_DEPTH = 32;
  inline constexpr std::size_t DEFAULT_MAX_DUMP_DEPTH = 64;

  // Registry tokens are hex renderings of this many random bytes
  inline constexpr std::size_t TOKEN_BYTES = 32;

  inline constexpr int FLOAT_PRECISION = 14;
  inline constexpr int PRETTY_JSON_INDENT = 4;

  // Upper bound on text produced by a single builtin function call
  inline constexpr std::size_t MAX_BUILTIN_OUTPUT = 1 << 20;

} // namespace autotag::internal

  class ObjectHandle;
  class Value;

  using Sequence = std::vector< Value >;
  using Mapping = std::map< std::string, Value >;
  using Arguments = std::vector< Value >;

  // Dynamic value threaded through tag resolution
  class Value {
  public:

    enum class Kind { Null, Bool, Int, Float, String, Sequence, Mapping,
      Object };

    Value() : data_( std::monostate() ) {}
    Value( bool b ) : data_( b ) {}
    Value( int i ) : data_( static_cast< std::int64_t >(i) ) {}
    Value( std::int64_t i ) : data_( i ) {}
    Value( double d ) : data_( d ) {}
    Value( const char* s ) : data_( std::string(s) ) {}
    Value( std::string s ) : data_( std::move(s) ) {}
    Value( Sequence seq ) : data_( std::move(seq) ) {}
    Value( Mapping map ) : data_( std::move(map) ) {}

    // A null handle is stored as Null
    Value( std::shared_ptr< ObjectHandle > obj ) : data_( std::monostate() ) {
      if ( obj ) data_ = std::move( obj );
    }

    Kind kind() const noexcept { return static_cast< Kind >( data_.index() ); }

    bool is_null() const noexcept { return kind() == Kind::Null; }
    bool is_bool() const noexcept { return kind() == Kind::Bool; }
    bool is_int() const noexcept { return kind() == Kind::Int; }
    bool is_float() const noexcept { return kind() == Kind::Float; }
    bool is_number() const noexcept { return is_int() || is_float(); }
    bool is_string() const noexcept { return kind() == Kind::String; }
    bool is_sequence() const noexcept { return kind() == Kind::Sequence; }
    bool is_mapping() const noexcept { return kind() == Kind::Mapping; }
    bool is_object() const noexcept { return kind() == Kind::Object; }

    // Checked accessors throw std::runtime_error on a kind mismatch
    bool as_bool() const { return get_checked< bool >( Kind::Bool ); }
    std::int64_t as_int() const
      { return get_checked< std::int64_t >( Kind::Int ); }
    double as_float() const { return get_checked< double >( Kind::Float ); }
    const std::string& as_string() const
      { return get_checked< std::string >( Kind::String ); }
    const Sequence& as_sequence() const
      { return get_checked< Sequence >( Kind::Sequence ); }
    const Mapping& as_mapping() const
      { return get_checked< Mapping >( Kind::Mapping ); }
    const std::shared_ptr< ObjectHandle >& as_object() const {
      return get_checked< std::shared_ptr< ObjectHandle > >( Kind::Object );
    }

    static const char* kind_name( Kind k ) {
      switch ( k ) {
        case Kind::Null: return "null";
        case Kind::Bool: return "bool";
        case Kind::Int: return "int";
        case Kind::Float: return "float";
        case Kind::String: return "string";
        case Kind::Sequence: return "sequence";
        case Kind::Mapping: return "mapping";
        case Kind::Object: return "object";
      }
      return "unknown";
    }

    const char* kind_name() const { return kind_name( kind() ); }

    // Objects compare by identity, everything else by content
    friend bool operator==( const Value& a, const Value& b ) {
      return a.data_ == b.data_;
    }
    friend bool operator!=( const Value& a, const Value& b ) {
      return !( a == b );
    }

  private:

    // Alternative order must follow Kind
    std::variant<
      std::monostate,
      bool,
      std::int64_t,
      double,
      std::string,
      Sequence,
      Mapping,
      std::shared_ptr< ObjectHandle >
    > data_;

    template < typename T >
    const T& get_checked( Kind expected ) const {
      if ( kind() != expected ) {
        std::ostringstream oss;
        oss << "Expected a " << kind_name( expected ) << " value (got: "
          << kind_name() << ")";
        throw std::runtime_error( oss.str() );
      }
      return std::get< T >( data_ );
    }

  }; // class Value

  // Capability exposed by object-like values. Only names an implementation
  // chooses to expose can be read or called from a tag.
  class ObjectHandle {
  public:
    virtual ~ObjectHandle() = default;

    virtual std::string class_name() const = 0;

    // Property names in the order they should be dumped
    virtual std::vector< std::string > property_names() const = 0;
    virtual std::optional< Value > get_property(
      const std::string& name ) const = 0;

    virtual bool has_method( const std::string& name ) const = 0;

    // Throws if the call cannot be completed
    virtual Value call_method( const std::string& name,
      const Arguments& args ) = 0;

    // Countable objects report their element count
    virtual std::optional< std::size_t > count() const { return std::nullopt; }
  };

  // Default ObjectHandle backed by a property table and an explicit method
  // registration table
  class Object : public ObjectHandle {
  public:
    using Method = std::function< Value( Object& self, const Arguments& args ) >;

    explicit Object( std::string class_name )
      : class_name_( std::move(class_name) ) {}

    Object& set( const std::string& name, Value value );
    Object& define_method( const std::string& name, Method method );
    bool erase( const std::string& name );

    const Mapping& properties() const { return properties_; }

    std::string class_name() const override { return class_name_; }
    std::vector< std::string > property_names() const override
      { return order_; }
    std::optional< Value > get_property(
      const std::string& name ) const override;
    bool has_method( const std::string& name ) const override;
    Value call_method( const std::string& name,
      const Arguments& args ) override;

  private:
    std::string class_name_;
    Mapping properties_;
    std::vector< std::string > order_;
    std::map< std::string, Method > methods_;
  };

  inline std::shared_ptr< Object > make_object( std::string class_name ) {
    return std::make_shared< Object >( std::move(class_name) );
  }

  // Request-scoped stores. Only the session map is ever written to by the
  // engine (through the unset post-processor).
  struct RequestState {
    Mapping get;
    Mapping post;
    Mapping cookie;
    Mapping server;
    Mapping session;
  };

  // Ephemeral token -> value store that exposes values which are not
  // reachable as globals
  class Registry {
  public:
    // Returns a fresh 64-character hex token for the stored value
    std::string register_value( Value value );

    const Value* find( const std::string& token ) const;
    const Mapping& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    void clear() { entries_.clear(); }

  private:
    Mapping entries_;
    std::random_device device_;
  };

  // Named globals plus the free-function namespace used by calls that have
  // no object context
  class Globals {
  public:
    using Function = std::function< Value( const Arguments& args ) >;

    void set( const std::string& name, Value value )
      { values_[ name ] = std::move( value ); }
    const Value* find( const std::string& name ) const;
    bool erase( const std::string& name ) { return values_.erase( name ) > 0; }
    const Mapping& values() const { return values_; }

    void define_function( const std::string& name, Function fn )
      { functions_[ name ] = std::move( fn ); }
    const Function* find_function( const std::string& name ) const;

  private:
    Mapping values_;
    std::map< std::string, Function > functions_;
  };

  struct Limits {
    // Longest tag body the scanner will recognize
    std::size_t max_tag_length = internal::DEFAULT_MAX_TAG_LENGTH;
    // Deepest parenthesis nesting allowed in a tag path
    std::size_t max_nesting_depth = internal::DEFAULT_MAX_NESTING_DEPTH;
    // Deepest nesting written by the dump and JSON encoders
    std::size_t max_dump_depth = internal::DEFAULT_MAX_DUMP_DEPTH;
    // Receives one line per fail-soft event when set
    std::ostream* diagnostics = nullptr;
  };

  class Engine {
  public:
    Engine( RequestState& request, Registry& registry, Globals& globals,
      Limits limits = Limits() )
      : request_( request ), registry_( registry ), globals_( globals ),
        limits_( limits ), session_() {}

    // Replace every tag in the text with its rendered value
    std::string resolve_buffer( const std::string& text );

    // Resolve a single tag given its already-scanned parts
    std::string resolve_tag( const std::string& path,
      const std::optional< std::string >& post_processor, bool raw );

    // Whole value named by a source keyword or global (a copy)
    Value source_value( const std::string& name ) const;
    Arguments tokenize( const std::string& raw ) const;

    // Apply accessors in order. An empty result means a lookup failed.
    std::optional< Value > walk( const Value& initial,
      const std::vector< std::string >& accessors ) const;

    Value post_process( PostProcessor post_processor, Value value,
      Source source, const std::vector< std::string >& accessors );

  private:

    RequestState& request_;
    Registry& registry_;
    Globals& globals_;
    Limits limits_;

    // Wraps internal state refreshed upon each call to resolve_buffer(...)
    struct ResolveSession {
      // Tag currently being resolved, used to label diagnostics
      std::string tag;
      std::size_t tags_seen = 0;
      std::size_t tags_failed = 0;
    };

    ResolveSession session_;

    // Request store behind a source keyword; nullptr for globals
    const Mapping* store_for( Source source ) const;

    // Source lookup plus walk without copying the store
    std::optional< Value > resolve_path( const std::string& source_name,
      const std::vector< std::string >& accessors ) const;

    std::optional< Value > invoke( const Value& current,
      const std::string& name, const std::string& raw_args ) const;

    void note( const std::string& message ) const;

  }; // class Engine

  // Fill request stores and globals from a YAML context document
  void load_context( const std::string& yaml_text, RequestState& request,
    Globals& globals );

  // YAML rendering of a store, e.g. the session after a pass
  std::string dump_mapping( const Mapping& map );

  // Register the standard free functions (upper, lower, trim, ...)
  void install_builtins( Globals& globals );

namespace internal {

  inline bool is_tag_body_char( char ch ) {
    unsigned char c = static_cast< unsigned char >( ch );
    if ( std::isalnum(c) || std::isspace(c) ) return true;
    switch ( ch ) {
      case '_': case '-': case ':': case '(': case ')':
      case '\'': case '"': case ',':
        return true;
      default: return false;
    }
  }

  inline bool is_post_processor_char( char ch ) {
    return std::isalpha( static_cast< unsigned char >(ch) ) || ch == '-';
  }

  // A tag found by find_tag(). [begin, end) covers the whole tag text.
  struct TagMatch {
    std::size_t begin = 0;
    std::size_t end = 0;
    std::string path;
    std::optional< std::string > post_processor;
    bool raw = false;
  };

  // Find the first tag at or after `from`. Grammar:
  //   '<' body ( '::' name )? '~'? '/>'
  // with body drawn from is_tag_body_char() and name from
  // is_post_processor_char(). The body is the shortest one that lets the rest
  // of the tag match, so "<a::b::c/>" has path "a::b" and post-processor "c".
  // Anything else is plain text.
  inline std::optional< TagMatch > find_tag( const std::string& text,
    std::size_t from, std::size_t max_length )
  {
    std::size_t open = text.find( TAG_OPEN, from );
    while ( open != std::string::npos ) {
      const std::size_t body = open + 1;

      // Consume the run of body characters. A run longer than max_length
      // disqualifies this candidate.
      std::size_t end = body;
      bool too_long = false;
      while ( end < text.size() && is_tag_body_char(text[end]) ) {
        if ( end - body >= max_length ) { too_long = true; break; }
        ++end;
      }

      std::size_t close = end;
      const bool raw = ( close < text.size() && text[close] == RAW_MARKER );
      if ( raw ) ++close;

      if ( !too_long && end > body
        && text.compare(close, TAG_CLOSE.size(), TAG_CLOSE) == 0 )
      {
        TagMatch match;
        match.begin = open;
        match.end = close + TAG_CLOSE.size();
        match.raw = raw;

        // Post-processor names cannot contain ':', so only the trailing run
        // of name characters can follow the "::"
        std::size_t name_begin = end;
        while ( name_begin > body && is_post_processor_char(text[name_begin - 1]) )
          --name_begin;

        std::size_t path_end = end;
        if ( name_begin < end && name_begin >= body + 1 + POST_PROCESSOR_PREFIX.size()
          && text.compare(name_begin - POST_PROCESSOR_PREFIX.size(),
            POST_PROCESSOR_PREFIX.size(), POST_PROCESSOR_PREFIX) == 0 )
        {
          path_end = name_begin - POST_PROCESSOR_PREFIX.size();
          match.post_processor = text.substr( name_begin, end - name_begin );
        }
        match.path = text.substr( body, path_end - body );
        return match;
      }

      open = text.find( TAG_OPEN, open + 1 );
    }
    return std::nullopt;
  }

  // Split on the delimiter wherever it is not inside parentheses. Empty
  // segments are kept except for a trailing one.
  inline std::vector< std::string > split_outside_parentheses(
    const std::string& input, char delimiter = PATH_DELIMITER )
  {
    std::vector< std::string > result;
    std::string buffer;
    std::size_t depth = 0;

    for ( char c : input ) {
      if ( c == '(' ) {
        ++depth;
        buffer += c;
      }
      else if ( c == ')' ) {
        if ( depth > 0 ) --depth;
        buffer += c;
      }
      else if ( c == delimiter && depth == 0 ) {
        result.push_back( buffer );
        buffer.clear();
      }
      else {
        buffer += c;
      }
    }

    if ( !buffer.empty() ) result.push_back( buffer );
    return result;
  }

  inline std::size_t max_paren_depth( const std::string& input ) {
    std::size_t depth = 0, deepest = 0;
    for ( char c : input ) {
      if ( c == '(' ) deepest = std::max( deepest, ++depth );
      else if ( c == ')' && depth > 0 ) --depth;
    }
    return deepest;
  }

  inline std::string trim( const std::string& s ) {
    std::size_t a = 0, b = s.size();
    while ( a < b && std::isspace(static_cast< unsigned char >(s[a])) ) ++a;
    while ( b > a && std::isspace(static_cast< unsigned char >(s[b - 1])) ) --b;
    return s.substr( a, b - a );
  }

  inline bool iequals( const std::string& a, const std::string& b ) {
    return a.size() == b.size() && std::equal( a.begin(), a.end(), b.begin(),
      []( char x, char y ) {
        return std::tolower( static_cast< unsigned char >(x) )
          == std::tolower( static_cast< unsigned char >(y) );
      } );
  }

  inline std::string to_upper_ascii( std::string s ) {
    std::transform( s.begin(), s.end(), s.begin(), []( unsigned char c ) {
      return static_cast< char >( std::toupper(c) );
    } );
    return s;
  }

  inline std::string to_lower_ascii( std::string s ) {
    std::transform( s.begin(), s.end(), s.begin(), []( unsigned char c ) {
      return static_cast< char >( std::tolower(c) );
    } );
    return s;
  }

  // Call accessor split into method/function name and raw argument text
  struct CallSegment {
    std::string name;
    std::string raw_args;
  };

  inline bool is_identifier_char( char ch ) {
    return std::isalnum( static_cast< unsigned char >(ch) ) || ch == '_';
  }

  // A segment is a call when it reads name(...) and the parenthesis opened
  // after the name is the one closed by the final character. Parentheses
  // inside quoted arguments are not counted.
  inline std::optional< CallSegment > parse_call( const std::string& segment ) {
    std::size_t open = 0;
    while ( open < segment.size() && is_identifier_char(segment[open]) ) ++open;
    if ( open == 0 || open >= segment.size() || segment[open] != '('
      || segment.back() != ')' )
    {
      return std::nullopt;
    }

    const std::string inner
      = segment.substr( open + 1, segment.size() - open - 2 );
    int depth = 0;
    char quote = 0;
    for ( std::size_t i = 0; i < inner.size(); ++i ) {
      const char c = inner[ i ];
      if ( quote ) {
        if ( c == '\\' ) ++i;
        else if ( c == quote ) quote = 0;
        continue;
      }
      if ( c == '\'' || c == '"' ) quote = c;
      else if ( c == '(' ) ++depth;
      else if ( c == ')' && --depth < 0 ) return std::nullopt;
    }
    if ( depth != 0 ) return std::nullopt;

    return CallSegment{ segment.substr( 0, open ), trim( inner ) };
  }

  // Split an argument list on commas outside quotes. Single and double
  // quotes are tracked separately and a backslash inside quotes escapes the
  // next character.
  inline std::vector< std::string > split_arguments( const std::string& raw ) {
    std::vector< std::string > out;
    const std::string text = trim( raw );
    if ( text.empty() ) return out;

    std::string buffer;
    char quote = 0;
    for ( std::size_t i = 0; i < text.size(); ++i ) {
      const char c = text[ i ];
      if ( quote ) {
        buffer += c;
        if ( c == '\\' && i + 1 < text.size() ) buffer += text[ ++i ];
        else if ( c == quote ) quote = 0;
        continue;
      }
      if ( c == '\'' || c == '"' ) {
        quote = c;
        buffer += c;
      }
      else if ( c == ARGUMENT_DELIMITER ) {
        out.push_back( trim(buffer) );
        buffer.clear();
      }
      else {
        buffer += c;
      }
    }
    out.push_back( trim(buffer) );
    return out;
  }

  // Resolve backslash escapes in a quoted literal: "\x" becomes "x" and
  // "\0" a NUL byte. A lone trailing backslash is dropped.
  inline std::string strip_slashes( const std::string& s ) {
    std::string out;
    out.reserve( s.size() );
    for ( std::size_t i = 0; i < s.size(); ++i ) {
      if ( s[i] != '\\' ) { out += s[ i ]; continue; }
      if ( ++i >= s.size() ) break;
      out += ( s[i] == '0' ? '\0' : s[i] );
    }
    return out;
  }

  inline std::size_t skip_digits( const std::string& s, std::size_t i ) {
    while ( i < s.size() && std::isdigit(static_cast< unsigned char >(s[i])) )
      ++i;
    return i;
  }

  // Decimal numerals: [+-] digits [. digits] [e [+-] digits], where either
  // side of the point may be empty but not both. Integers that fit in 64
  // bits become Int, other numerals Float.
  inline std::optional< Value > parse_number( const std::string& token ) {
    std::size_t i = 0;
    if ( i < token.size() && ( token[i] == '+' || token[i] == '-' ) ) ++i;

    const std::size_t int_begin = i;
    i = skip_digits( token, i );
    bool has_digits = i > int_begin;
    bool integral = true;

    if ( i < token.size() && token[i] == '.' ) {
      integral = false;
      const std::size_t frac_begin = ++i;
      i = skip_digits( token, i );
      has_digits = has_digits || i > frac_begin;
    }
    if ( !has_digits ) return std::nullopt;

    if ( i < token.size() && ( token[i] == 'e' || token[i] == 'E' ) ) {
      integral = false;
      ++i;
      if ( i < token.size() && ( token[i] == '+' || token[i] == '-' ) ) ++i;
      const std::size_t exp_begin = i;
      i = skip_digits( token, i );
      if ( i == exp_begin ) return std::nullopt;
    }
    if ( i != token.size() ) return std::nullopt;

    if ( integral ) {
      errno = 0;
      const long long n = std::strtoll( token.c_str(), nullptr, 10 );
      if ( errno != ERANGE ) return Value( static_cast< std::int64_t >(n) );
    }
    return Value( std::strtod( token.c_str(), nullptr ) );
  }

  // One classified entry of a call's argument list
  struct ArgumentToken {
    enum class Kind { String, Number, Bool, Null, Reference, Unrecognized };

    Kind kind = Kind::Unrecognized;
    // Value of literal tokens (Null for references and unrecognized text)
    Value literal;
    // Reference tokens only
    std::string source;
    std::vector< std::string > path;
  };

  // source:path[:path...] with a lowercase source name
  inline bool is_reference( const std::string& token, std::size_t& colon ) {
    colon = 0;
    while ( colon < token.size() && token[colon] >= 'a' && token[colon] <= 'z' )
      ++colon;
    if ( colon == 0 || colon + 1 >= token.size() || token[colon] != ':' )
      return false;
    for ( std::size_t i = colon + 1; i < token.size(); ++i ) {
      const char c = token[ i ];
      if ( !is_identifier_char(c) && c != ':' && c != '-' ) return false;
    }
    return true;
  }

  inline ArgumentToken classify_argument( const std::string& token ) {
    ArgumentToken out;

    if ( !token.empty() && ( token.front() == '\'' || token.front() == '"' )
      && token.back() == token.front() )
    {
      out.kind = ArgumentToken::Kind::String;
      out.literal = strip_slashes( token.size() >= 2
        ? token.substr( 1, token.size() - 2 ) : std::string() );
      return out;
    }

    std::size_t colon = 0;
    if ( is_reference( token, colon ) ) {
      out.kind = ArgumentToken::Kind::Reference;
      out.source = token.substr( 0, colon );

      // Plain split: references never contain parentheses, and empty
      // segments are kept so that they fail the lookup
      std::size_t start = colon + 1;
      while ( true ) {
        std::size_t pos = token.find( PATH_DELIMITER, start );
        if ( pos == std::string::npos ) {
          out.path.push_back( token.substr(start) );
          break;
        }
        out.path.push_back( token.substr(start, pos - start) );
        start = pos + 1;
      }
      return out;
    }

    if ( auto number = parse_number( token ) ) {
      out.kind = ArgumentToken::Kind::Number;
      out.literal = *number;
    }
    else if ( iequals( token, "true" ) || iequals( token, "false" ) ) {
      out.kind = ArgumentToken::Kind::Bool;
      out.literal = iequals( token, "true" );
    }
    else if ( iequals( token, "null" ) ) {
      out.kind = ArgumentToken::Kind::Null;
    }
    return out;
  }

  inline Source classify_source( const std::string& name ) {
    if ( name == SOURCE_SESSION ) return Source::Session;
    if ( name == SOURCE_FORM ) return Source::Form;
    if ( name == SOURCE_QUERY ) return Source::Query;
    if ( name == SOURCE_COOKIE ) return Source::Cookie;
    if ( name == SOURCE_SERVER ) return Source::Server;
    if ( name == SOURCE_REGISTRY ) return Source::Registry;
    return Source::Global;
  }

  inline PostProcessor classify_post_processor(
    const std::optional< std::string >& name )
  {
    if ( !name ) return PostProcessor::None;

    static const std::map< std::string, PostProcessor > table = {
      { "json", PostProcessor::Json },
      { "pjson", PostProcessor::PrettyJson },
      { "jsonp", PostProcessor::PrettyJson },
      { "prettyjson", PostProcessor::PrettyJson },
      { "json-p", PostProcessor::PrettyJson },
      { "pretty-json", PostProcessor::PrettyJson },
      { "length", PostProcessor::Length },
      { "count", PostProcessor::Count },
      { "upper", PostProcessor::Upper },
      { "lower", PostProcessor::Lower },
      { "unset", PostProcessor::Unset }
    };

    auto it = table.find( *name );
    return it == table.end() ? PostProcessor::Unknown : it->second;
  }

  // Sequence keys are canonical decimal indices ("0", "12"; not "01", "+1")
  inline std::optional< std::size_t > parse_sequence_index(
    const std::string& key )
  {
    if ( key.empty() || key.size() > 18 ) return std::nullopt;
    if ( key.size() > 1 && key[0] == '0' ) return std::nullopt;
    std::size_t index = 0;
    for ( char c : key ) {
      if ( !std::isdigit(static_cast< unsigned char >(c)) ) return std::nullopt;
      index = index * 10 + static_cast< std::size_t >( c - '0' );
    }
    return index;
  }

  // Key accessor against mappings and sequences. Points into `current`;
  // nullptr when the key is absent. Object properties are read by the walker.
  inline const Value* find_child( const Value& current,
    const std::string& key )
  {
    switch ( current.kind() ) {
      case Value::Kind::Mapping: {
        const Mapping& map = current.as_mapping();
        auto it = map.find( key );
        return it == map.end() ? nullptr : &it->second;
      }
      case Value::Kind::Sequence: {
        const Sequence& seq = current.as_sequence();
        auto index = parse_sequence_index( key );
        if ( !index || *index >= seq.size() ) return nullptr;
        return &seq[ *index ];
      }
      default:
        return nullptr;
    }
  }

  inline std::string html_escape( const std::string& s ) {
    std::string out;
    out.reserve( s.size() );
    for ( char c : s ) {
      switch ( c ) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&#039;"; break;
        default: out.push_back( c ); break;
      }
    }
    return out;
  }

  // Up to FLOAT_PRECISION significant digits; integral values print without
  // a fraction. Exponent form keeps one fractional digit and drops exponent
  // padding: 1e20 -> "1.0E+20", 1.5e-7 -> "1.5E-7".
  inline std::string format_number( double d ) {
    if ( std::isnan(d) ) return "NAN";
    if ( std::isinf(d) ) return d > 0 ? "INF" : "-INF";
    char buf[ 32 ];
    std::snprintf( buf, sizeof(buf), "%.*G", FLOAT_PRECISION, d );

    const std::string text = buf;
    const std::size_t e = text.find( 'E' );
    if ( e == std::string::npos ) return text;

    std::string mantissa = text.substr( 0, e );
    if ( mantissa.find( '.' ) == std::string::npos ) mantissa += ".0";
    const char sign = text[ e + 1 ];
    std::size_t digits = e + 2;
    while ( digits + 1 < text.size() && text[digits] == '0' ) ++digits;
    return mantissa + 'E' + sign + text.substr( digits );
  }

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return format_number(
      to_native_checked< double >( n )
    );
    return ordered_node::serialize( n );
  }

  // Value -> YAML DOM. Nesting beyond depth_left becomes RECURSION_MARKER.
  inline ordered_node to_node( const Value& value, std::size_t depth_left ) {
    if ( depth_left == 0 ) return make_node_from( RECURSION_MARKER );

    switch ( value.kind() ) {
      case Value::Kind::Null: return ordered_node();
      case Value::Kind::Bool: return make_node_from( value.as_bool() );
      case Value::Kind::Int: return make_node_from( value.as_int() );
      case Value::Kind::Float: return make_node_from( value.as_float() );
      case Value::Kind::String: return make_node_from( value.as_string() );
      case Value::Kind::Sequence: {
        std::vector< ordered_node > out;
        out.reserve( value.as_sequence().size() );
        for ( const auto& el : value.as_sequence() ) {
          out.push_back( to_node(el, depth_left - 1) );
        }
        return make_node_from( out );
      }
      case Value::Kind::Mapping: {
        ordered_node map = ordered_node::mapping();
        for ( const auto& [k, v] : value.as_mapping() ) {
          map[ k ] = to_node( v, depth_left - 1 );
        }
        return map;
      }
      case Value::Kind::Object: {
        // Objects dump as a mapping of their readable properties
        const auto& obj = value.as_object();
        ordered_node map = ordered_node::mapping();
        for ( const auto& name : obj->property_names() ) {
          if ( auto prop = obj->get_property( name ) ) {
            map[ name ] = to_node( *prop, depth_left - 1 );
          }
        }
        return map;
      }
    }
    return ordered_node();
  }

  // YAML DOM -> Value. `path` labels errors ("context.session.cart[1]")
  inline Value from_node( const ordered_node& node, const std::string& path ) {
    if ( node.is_null() ) return Value();
    if ( node.is_boolean() ) return Value( node.get_value< bool >() );
    if ( node.is_integer() ) {
      return Value( to_native_checked< std::int64_t >( node ) );
    }
    if ( node.is_float_number() ) {
      return Value( to_native_checked< double >( node ) );
    }
    if ( node.is_string() ) {
      return Value( to_native_checked< std::string >( node ) );
    }
    if ( node.is_sequence() ) {
      Sequence seq;
      seq.reserve( node.size() );
      for ( std::size_t i = 0; i < node.size(); ++i ) {
        seq.push_back( from_node( node.at(i),
          path + '[' + std::to_string( i ) + ']' ) );
      }
      return Value( std::move(seq) );
    }
    if ( node.is_mapping() ) {
      Mapping map;
      for ( const auto& [mk, mv] : node.map_items() ) {
        // Non-string keys (integers, booleans) are keyed by their text
        const std::string k = to_string_any( mk );
        map[ k ] = from_node( mv, path + '.' + k );
      }
      return Value( std::move(map) );
    }
    throw std::runtime_error( path + ": unsupported YAML node" );
  }

  // Value -> JSON. Objects encode their readable properties.
  inline nlohmann::json to_json( const Value& value, std::size_t depth_left ) {
    if ( depth_left == 0 ) return RECURSION_MARKER;

    switch ( value.kind() ) {
      case Value::Kind::Null: return nullptr;
      case Value::Kind::Bool: return value.as_bool();
      case Value::Kind::Int: return value.as_int();
      case Value::Kind::Float: return value.as_float();
      case Value::Kind::String: return value.as_string();
      case Value::Kind::Sequence: {
        nlohmann::json arr = nlohmann::json::array();
        for ( const auto& el : value.as_sequence() ) {
          arr.push_back( to_json(el, depth_left - 1) );
        }
        return arr;
      }
      case Value::Kind::Mapping: {
        nlohmann::json obj = nlohmann::json::object();
        for ( const auto& [k, v] : value.as_mapping() ) {
          obj[ k ] = to_json( v, depth_left - 1 );
        }
        return obj;
      }
      case Value::Kind::Object: {
        const auto& handle = value.as_object();
        nlohmann::json obj = nlohmann::json::object();
        for ( const auto& name : handle->property_names() ) {
          if ( auto prop = handle->get_property( name ) ) {
            obj[ name ] = to_json( *prop, depth_left - 1 );
          }
        }
        return obj;
      }
    }
    return nullptr;
  }

  // Human-readable structured dump (YAML block text)
  inline std::string dump_value( const Value& value, std::size_t max_depth ) {
    return ordered_node::serialize( to_node( value, max_depth ) );
  }

  // Render a value for substitution, HTML-escaped when sanitize is set
  inline std::string format_value( const Value& value, bool sanitize,
    std::size_t max_depth )
  {
    std::string text;
    switch ( value.kind() ) {
      case Value::Kind::Null: break;
      case Value::Kind::Bool: text = value.as_bool() ? "1" : ""; break;
      case Value::Kind::Int: text = std::to_string( value.as_int() ); break;
      case Value::Kind::Float: text = format_number( value.as_float() ); break;
      case Value::Kind::String: text = value.as_string(); break;
      case Value::Kind::Sequence:
      case Value::Kind::Mapping:
      case Value::Kind::Object:
        text = dump_value( value, max_depth );
        break;
    }
    return sanitize ? html_escape( text ) : text;
  }

  // Argument checks shared by the builtin functions

  inline void expect_arity( const Arguments& args, std::size_t min,
    std::size_t max, const std::string& fn )
  {
    if ( args.size() >= min && args.size() <= max ) return;
    std::ostringstream oss;
    oss << fn << "() expects ";
    if ( min == max ) oss << min;
    else if ( max == static_cast< std::size_t >( -1 ) ) oss << "at least " << min;
    else oss << min << " to " << max;
    oss << " argument(s), got " << args.size();
    throw std::runtime_error( oss.str() );
  }

  inline std::string scalar_text( const Value& v, const std::string& fn ) {
    if ( v.is_sequence() || v.is_mapping() || v.is_object() ) {
      throw std::runtime_error( fn + "() expects scalar arguments (got: "
        + v.kind_name() + ")" );
    }
    return format_value( v, false, 1 );
  }

  inline std::optional< std::size_t > count_of( const Value& v ) {
    if ( v.is_sequence() ) return v.as_sequence().size();
    if ( v.is_mapping() ) return v.as_mapping().size();
    if ( v.is_object() ) return v.as_object()->count();
    return std::nullopt;
  }

} // namespace autotag::internal

} // namespace autotag

// Object member function definitions

inline autotag::Object& autotag::Object::set( const std::string& name,
  Value value )
{
  if ( !properties_.count(name) ) order_.push_back( name );
  properties_[ name ] = std::move( value );
  return *this;
}

inline autotag::Object& autotag::Object::define_method(
  const std::string& name, Method method )
{
  methods_[ name ] = std::move( method );
  return *this;
}

inline bool autotag::Object::erase( const std::string& name ) {
  if ( !properties_.erase(name) ) return false;
  order_.erase( std::remove(order_.begin(), order_.end(), name), order_.end() );
  return true;
}

inline std::optional< autotag::Value > autotag::Object::get_property(
  const std::string& name ) const
{
  auto it = properties_.find( name );
  if ( it == properties_.end() ) return std::nullopt;
  return it->second;
}

inline bool autotag::Object::has_method( const std::string& name ) const {
  return methods_.count( name ) > 0;
}

inline autotag::Value autotag::Object::call_method( const std::string& name,
  const Arguments& args )
{
  auto it = methods_.find( name );
  if ( it == methods_.end() ) {
    throw std::runtime_error( class_name_ + " has no method '" + name + "'" );
  }
  return it->second( *this, args );
}

// Store member function definitions

inline std::string autotag::Registry::register_value( Value value ) {
  static const char* HEX = "0123456789abcdef";
  std::uniform_int_distribution< int > byte( 0, 255 );

  std::string token;
  do {
    token.clear();
    for ( std::size_t i = 0; i < internal::TOKEN_BYTES; ++i ) {
      const int b = byte( device_ );
      token += HEX[ b >> 4 ];
      token += HEX[ b & 0x0F ];
    }
  } while ( entries_.count(token) );

  entries_[ token ] = std::move( value );
  return token;
}

inline const autotag::Value* autotag::Registry::find(
  const std::string& token ) const
{
  auto it = entries_.find( token );
  return it == entries_.end() ? nullptr : &it->second;
}

inline const autotag::Value* autotag::Globals::find(
  const std::string& name ) const
{
  auto it = values_.find( name );
  return it == values_.end() ? nullptr : &it->second;
}

inline const autotag::Globals::Function* autotag::Globals::find_function(
  const std::string& name ) const
{
  auto it = functions_.find( name );
  return it == functions_.end() ? nullptr : &it->second;
}

// Engine member function definitions

inline std::string autotag::Engine::resolve_buffer( const std::string& text ) {
  // Rebuild default session state for this call
  session_ = ResolveSession();

  std::string out;
  out.reserve( text.size() );

  std::size_t pos = 0;
  while ( auto match
    = internal::find_tag( text, pos, limits_.max_tag_length ) )
  {
    out.append( text, pos, match->begin - pos );
    out += this->resolve_tag( match->path, match->post_processor, match->raw );
    pos = match->end;
  }
  out.append( text, pos, std::string::npos );

  if ( limits_.diagnostics && session_.tags_seen > 0 ) {
    *limits_.diagnostics << "[autotag] resolved " << session_.tags_seen
      << " tag(s), " << session_.tags_failed << " failed\n";
  }
  return out;
}

// Source -> walk -> post-process -> format. A failed lookup substitutes an
// empty string without running the post-processor. Exceptions from object
// handles, encoders or the dump fail this tag only.
inline std::string autotag::Engine::resolve_tag( const std::string& path,
  const std::optional< std::string >& post_processor, bool raw )
{
  session_.tag = path;
  if ( post_processor ) {
    session_.tag += internal::POST_PROCESSOR_PREFIX + *post_processor;
  }
  ++session_.tags_seen;

  try {
    if ( internal::max_paren_depth(path) > limits_.max_nesting_depth ) {
      this->note( "parenthesis nesting exceeds "
        + std::to_string( limits_.max_nesting_depth ) );
      ++session_.tags_failed;
      return std::string();
    }

    std::vector< std::string > accessors
      = internal::split_outside_parentheses( path );
    if ( accessors.empty() ) {
      ++session_.tags_failed;
      return std::string();
    }

    const std::string source_name = accessors.front();
    accessors.erase( accessors.begin() );

    std::optional< Value > resolved
      = this->resolve_path( source_name, accessors );
    if ( !resolved ) {
      ++session_.tags_failed;
      return std::string();
    }

    const PostProcessor pp
      = internal::classify_post_processor( post_processor );
    if ( pp == PostProcessor::Unknown ) {
      this->note( "unknown post-processor '" + *post_processor + "'" );
    }

    const Value value = this->post_process( pp, std::move( *resolved ),
      internal::classify_source( source_name ), accessors );
    return internal::format_value( value, !raw, limits_.max_dump_depth );
  }
  catch ( const std::exception& ex ) {
    this->note( std::string( "resolution failed: " ) + ex.what() );
    ++session_.tags_failed;
    return std::string();
  }
}

inline const autotag::Mapping* autotag::Engine::store_for(
  Source source ) const
{
  switch ( source ) {
    case Source::Query: return &request_.get;
    case Source::Form: return &request_.post;
    case Source::Cookie: return &request_.cookie;
    case Source::Server: return &request_.server;
    case Source::Session: return &request_.session;
    case Source::Registry: return &registry_.entries();
    case Source::Global: break;
  }
  return nullptr;
}

// Unknown identifiers fall back to the named globals; a missing global is
// Null rather than a failure
inline autotag::Value autotag::Engine::source_value(
  const std::string& name ) const
{
  if ( const Mapping* store = this->store_for( internal::classify_source(name) ) ) {
    return Value( *store );
  }
  if ( const Value* global = globals_.find( name ) ) return *global;
  return Value();
}

// The first key is looked up in the store itself so that only the selected
// entry is walked. A leading call on a store is walked from a copy and
// fails there like any call on a mapping.
inline std::optional< autotag::Value > autotag::Engine::resolve_path(
  const std::string& source_name,
  const std::vector< std::string >& accessors ) const
{
  const Mapping* store
    = this->store_for( internal::classify_source( source_name ) );
  if ( !store ) {
    if ( const Value* global = globals_.find( source_name ) ) {
      return this->walk( *global, accessors );
    }
    return this->walk( Value(), accessors );
  }
  if ( accessors.empty() || internal::parse_call( accessors.front() ) ) {
    return this->walk( Value( *store ), accessors );
  }

  auto it = store->find( accessors.front() );
  if ( it == store->end() ) {
    this->note( "lookup failed at '" + accessors.front() + "' (in a "
      + Value::kind_name( Value::Kind::Mapping ) + ")" );
    return std::nullopt;
  }
  const std::vector< std::string > rest( accessors.begin() + 1,
    accessors.end() );
  return this->walk( it->second, rest );
}

// References are resolved here, before the call they belong to runs. An
// unresolvable reference or unrecognized token becomes Null.
inline autotag::Arguments autotag::Engine::tokenize(
  const std::string& raw ) const
{
  using Kind = internal::ArgumentToken::Kind;

  Arguments args;
  for ( const auto& piece : internal::split_arguments( raw ) ) {
    internal::ArgumentToken token = internal::classify_argument( piece );
    if ( token.kind == Kind::Reference ) {
      std::optional< Value > ref
        = this->resolve_path( token.source, token.path );
      args.push_back( ref ? std::move( *ref ) : Value() );
      continue;
    }
    if ( token.kind == Kind::Unrecognized ) {
      this->note( "argument '" + piece + "' not recognized, using null" );
    }
    args.push_back( std::move( token.literal ) );
  }
  return args;
}

// `current` points into `initial` until a call result or object property is
// reached; such values are kept in `held`. Only the final value is copied.
inline std::optional< autotag::Value > autotag::Engine::walk(
  const Value& initial, const std::vector< std::string >& accessors ) const
{
  const Value* current = &initial;
  std::optional< Value > held;

  for ( const auto& segment : accessors ) {
    std::optional< Value > produced;
    if ( auto call = internal::parse_call( segment ) ) {
      produced = this->invoke( *current, call->name, call->raw_args );
      if ( !produced ) return std::nullopt;
    }
    else if ( current->is_object() ) {
      produced = current->as_object()->get_property( segment );
    }
    else if ( const Value* child = internal::find_child( *current, segment ) ) {
      current = child;
      continue;
    }

    if ( !produced ) {
      this->note( "lookup failed at '" + segment + "' (in a "
        + current->kind_name() + ")" );
      return std::nullopt;
    }
    held = std::move( produced );
    current = &*held;
  }
  return *current;
}

// Object methods take precedence. Free functions are only reachable when
// there is no object context (current value is Null).
inline std::optional< autotag::Value > autotag::Engine::invoke(
  const Value& current, const std::string& name,
  const std::string& raw_args ) const
{
  const Arguments args = this->tokenize( raw_args );

  try {
    if ( current.is_object() && current.as_object()->has_method(name) ) {
      return current.as_object()->call_method( name, args );
    }
    if ( current.is_null() ) {
      if ( const Globals::Function* fn = globals_.find_function( name ) ) {
        return ( *fn )( args );
      }
    }
  }
  catch ( const std::exception& ex ) {
    this->note( "call to '" + name + "' failed: " + ex.what() );
    return std::nullopt;
  }

  this->note( "no method or function '" + name + "' for a "
    + current.kind_name() );
  return std::nullopt;
}

inline autotag::Value autotag::Engine::post_process(
  PostProcessor post_processor, Value value, Source source,
  const std::vector< std::string >& accessors )
{
  switch ( post_processor ) {
    case PostProcessor::None:
      return value;

    case PostProcessor::Json:
    case PostProcessor::PrettyJson: {
      try {
        const nlohmann::json json
          = internal::to_json( value, limits_.max_dump_depth );
        if ( post_processor == PostProcessor::Json ) return json.dump();
        return json.dump( internal::PRETTY_JSON_INDENT );
      }
      catch ( const nlohmann::json::exception& ex ) {
        // Invalid UTF-8 in a string
        this->note( std::string( "json encoding failed: " ) + ex.what() );
        return Value( "" );
      }
    }

    case PostProcessor::Length:
      if ( !value.is_string() ) return Value( "" );
      return Value( static_cast< std::int64_t >( value.as_string().size() ) );

    case PostProcessor::Count: {
      auto n = internal::count_of( value );
      if ( !n ) return Value( "" );
      return Value( static_cast< std::int64_t >( *n ) );
    }

    case PostProcessor::Upper:
      if ( !value.is_string() ) return Value( "" );
      return Value( internal::to_upper_ascii( value.as_string() ) );

    case PostProcessor::Lower:
      if ( !value.is_string() ) return Value( "" );
      return Value( internal::to_lower_ascii( value.as_string() ) );

    case PostProcessor::Unset:
      // Only a direct session key can be removed
      if ( source == Source::Session && accessors.size() == 1 ) {
        request_.session.erase( accessors.front() );
      }
      return Value( "" );

    case PostProcessor::Unknown:
      return Value( "" );
  }
  return Value( "" );
}

inline void autotag::Engine::note( const std::string& message ) const {
  if ( !limits_.diagnostics ) return;
  *limits_.diagnostics << "[autotag] <" << session_.tag << "/>: " << message
    << '\n';
}

// Context document, e.g.
//
//   get:      { page: 2 }
//   session:  { user: alice }
//   globals:  { site: { name: Example } }
//
// Sections are merged into the existing stores; later keys win.
inline void autotag::load_context( const std::string& yaml_text,
  RequestState& request, Globals& globals )
{
  const ordered_node doc = ordered_node::deserialize( yaml_text );
  if ( doc.is_null() ) return;
  if ( !doc.is_mapping() ) {
    throw std::runtime_error(
      "context: document must be a mapping of sections" );
  }

  const std::map< std::string, Mapping* > stores = {
    { internal::SOURCE_QUERY, &request.get },
    { internal::SOURCE_FORM, &request.post },
    { internal::SOURCE_COOKIE, &request.cookie },
    { internal::SOURCE_SERVER, &request.server },
    { internal::SOURCE_SESSION, &request.session }
  };

  for ( const auto& [mk, mv] : doc.map_items() ) {
    const std::string section = internal::to_string_any( mk );
    const std::string where = "context." + section;

    const bool is_globals = ( section == internal::SECTION_GLOBALS );
    auto store = stores.find( section );
    if ( !is_globals && store == stores.end() ) {
      std::ostringstream oss;
      oss << "context: unknown section '" << section << "' (expected one of: ";
      for ( const auto& kv : stores ) oss << kv.first << ", ";
      oss << internal::SECTION_GLOBALS << ")";
      throw std::runtime_error( oss.str() );
    }

    if ( mv.is_null() ) continue;
    if ( !mv.is_mapping() ) {
      throw std::runtime_error( where + ": section must be a mapping" );
    }

    const Value section_value = internal::from_node( mv, where );
    for ( const auto& [k, v] : section_value.as_mapping() ) {
      if ( is_globals ) globals.set( k, v );
      else ( *store->second )[ k ] = v;
    }
  }
}

inline std::string autotag::dump_mapping( const Mapping& map ) {
  return internal::dump_value( Value( map ), internal::DEFAULT_MAX_DUMP_DEPTH );
}

// Standard library of free functions. Handlers throw on bad arguments, which
// the engine reports as a failed lookup.
inline void autotag::install_builtins( Globals& globals ) {
  using internal::expect_arity;
  constexpr std::size_t VARIADIC = static_cast< std::size_t >( -1 );

  globals.define_function( "upper", []( const Arguments& args ) -> Value {
    expect_arity( args, 1, 1, "upper" );
    return internal::to_upper_ascii( args[0].as_string() );
  } );

  globals.define_function( "lower", []( const Arguments& args ) -> Value {
    expect_arity( args, 1, 1, "lower" );
    return internal::to_lower_ascii( args[0].as_string() );
  } );

  globals.define_function( "trim", []( const Arguments& args ) -> Value {
    expect_arity( args, 1, 1, "trim" );
    return internal::trim( args[0].as_string() );
  } );

  globals.define_function( "length", []( const Arguments& args ) -> Value {
    expect_arity( args, 1, 1, "length" );
    return static_cast< std::int64_t >( args[0].as_string().size() );
  } );

  globals.define_function( "count", []( const Arguments& args ) -> Value {
    expect_arity( args, 1, 1, "count" );
    auto n = internal::count_of( args[0] );
    if ( !n ) {
      throw std::runtime_error( std::string( "count() cannot count a " )
        + args[0].kind_name() );
    }
    return static_cast< std::int64_t >( *n );
  } );

  globals.define_function( "concat", [=]( const Arguments& args ) -> Value {
    expect_arity( args, 1, VARIADIC, "concat" );
    std::string out;
    for ( const auto& a : args ) out += internal::scalar_text( a, "concat" );
    return out;
  } );

  // join(separator, sequence)
  globals.define_function( "join", []( const Arguments& args ) -> Value {
    expect_arity( args, 2, 2, "join" );
    const std::string& sep = args[0].as_string();
    std::string out;
    bool first = true;
    for ( const auto& el : args[1].as_sequence() ) {
      if ( !first ) out += sep;
      out += internal::scalar_text( el, "join" );
      first = false;
    }
    return out;
  } );

  // repeat(text, times)
  globals.define_function( "repeat", []( const Arguments& args ) -> Value {
    expect_arity( args, 2, 2, "repeat" );
    const std::string& text = args[0].as_string();
    const std::int64_t times = args[1].as_int();
    if ( times < 0 ) {
      throw std::runtime_error( "repeat() count must not be negative" );
    }
    if ( !text.empty() && static_cast< std::size_t >( times )
      > internal::MAX_BUILTIN_OUTPUT / text.size() )
    {
      throw std::runtime_error( "repeat() result too large" );
    }
    std::string out;
    for ( std::int64_t i = 0; i < times; ++i ) out += text;
    return out;
  } );

  // default(value, fallback): fallback when value is null or ""
  globals.define_function( "default", []( const Arguments& args ) -> Value {
    expect_arity( args, 2, 2, "default" );
    const Value& v = args[0];
    if ( v.is_null() || ( v.is_string() && v.as_string().empty() ) ) {
      return args[1];
    }
    return v;
  } );
}
