// ┏┳┓┏━┓┏━┓╺┳╸┏━┓┏━┓
// ┃┃┃┃ ┃┣┳┛ ┃ ┣━┫┣┳┛
// ╹ ╹┗━┛╹┗╸ ╹ ╹ ╹╹┗╸
//  Mustache-style template node core over YAML data
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <atomic>
#include <cctype>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace mortar {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map preserves the lexical order of the input data
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // A scope is a borrowed view of a data value. The null Scope is the
  // "absent" sentinel: it is never pushed onto a scope stack.
  using Scope = std::shared_ptr< const ordered_node >;

  // Outermost scope first, innermost scope last
  using ScopeStack = std::vector< Scope >;

  inline Scope make_scope( const ordered_node& value ) {
    return std::make_shared< const ordered_node >( value );
  }

  // Single failure category for everything that goes wrong while rendering
  // or reconstructing a compiled tree
  class RenderError : public std::runtime_error {
  public:
    explicit RenderError( const std::string& msg )
      : std::runtime_error( msg ) {}
  };

namespace internal {

  // Constants for the tag grammar, kept together for easy editing
  inline constexpr char PATH_DELIMITER = '.';

  inline const std::string SELF_NAME = ".";
  inline const std::string DEFAULT_OPEN = "{{";
  inline const std::string DEFAULT_CLOSE = "}}";
  inline const std::string SIZE_ACCESSOR = "size";
  inline const std::string LOG_PREFIX = "[mortar] ";

  // Kind markers written right after the open delimiter
  inline const std::string VALUE_MARKER = "";
  inline const std::string UNESCAPED_MARKER = "&";
  inline const std::string TRIPLE_OPEN_MARKER = "{";
  inline const std::string TRIPLE_CLOSE_MARKER = "}";
  inline const std::string SECTION_MARKER = "#";
  inline const std::string INVERTED_MARKER = "^";
  inline const std::string CLOSE_MARKER = "/";
  inline const std::string COMMENT_MARKER = "!";
  inline const std::string DELIMITER_MARKER = "=";
  inline const std::string PARTIAL_MARKER = ">";

} // namespace mortar::internal

  // Per-render configuration. Passed explicitly into every render call so
  // concurrent renders with different settings never interfere.
  struct RenderOptions {
    // Trace unresolved names and other diagnostics while rendering
    bool debug = false;
    // Destination for debug lines (std::cerr when null)
    std::ostream* log = nullptr;
  };

  // Output destination threaded through execute() and identity(). The
  // underlying stream is borrowed for the duration of one call chain.
  class Sink {
  public:
    explicit Sink( std::ostream& out,
      const RenderOptions& options = RenderOptions() )
      : out_( out ), options_( options ) {}

    // Write text and raise RenderError if the stream rejects it
    Sink& write( const std::string& text );

    // Emit a debug line when tracing is enabled
    void trace( const std::string& message ) const;

    std::ostream& stream() { return out_; }
    const RenderOptions& options() const { return options_; }

  private:
    std::ostream& out_;
    RenderOptions options_;
  };

  // Delimiters (and source position) in effect when a node was compiled
  struct TemplateContext {
    std::string open = internal::DEFAULT_OPEN;
    std::string close = internal::DEFAULT_CLOSE;
    std::string file;
    int line = 0;

    std::string location() const;
  };

  // A name bound to a compile-time context, able to look itself up in a
  // scope stack. Implementations must tolerate concurrent calls.
  class Binding {
  public:
    virtual ~Binding() = default;

    // Returns the matching value or a null Scope when nothing matches
    virtual Scope get( const ScopeStack& scopes ) const = 0;
  };

  // Value resolution capability consumed by nodes
  class ObjectHandler {
  public:
    virtual ~ObjectHandler() = default;

    virtual std::shared_ptr< Binding > create_binding(
      const std::string& name, const TemplateContext& tc ) const = 0;

    // Look up one path segment directly on a single scope value
    virtual Scope find( const Scope& scope,
      const std::string& segment ) const = 0;
  };

  // One pluggable lookup strategy (mapping key, sequence index, accessor...)
  using Lookup = std::function< Scope( const Scope& scope,
    const std::string& segment ) >;

  // Object handler for fkYAML data. Lookups are tried in registration order
  // and the first non-null answer wins.
  class YamlObjectHandler : public ObjectHandler {
  public:
    // Installs the mapping-key, sequence-index and size-accessor lookups
    YamlObjectHandler();

    // Register an additional lookup. Configuration phase only: must not be
    // called once templates compiled against this handler are rendering.
    // Anything a lookup throws is reported to bindings as std::runtime_error.
    void add_lookup( Lookup lookup );

    std::shared_ptr< Binding > create_binding( const std::string& name,
      const TemplateContext& tc ) const override;

    Scope find( const Scope& scope,
      const std::string& segment ) const override;

  private:
    std::vector< Lookup > lookups_;
  };

  // Binding that remembers where a name was last found and re-validates that
  // answer against the shape of each new scope stack before trusting it
  class GuardedBinding : public Binding {
  public:
    GuardedBinding( const ObjectHandler& handler, const std::string& name );

    Scope get( const ScopeStack& scopes ) const override;

    // Cache statistics
    std::size_t hits() const { return hits_.load(); }
    std::size_t misses() const { return misses_.load(); }

  private:
    // Cached resolution: the stack fingerprint and which scope held the
    // first path segment
    struct Guard {
      std::string shape;
      std::size_t depth = 0;
      bool valid = false;
    };

    bool guard_holds( const Guard& guard, const std::string& shape,
      const ScopeStack& scopes ) const;
    Scope search( const ScopeStack& scopes, std::size_t& depth ) const;
    Scope descend( Scope found ) const;

    const ObjectHandler& handler_;
    std::vector< std::string > segments_;

    mutable std::mutex mutex_;
    mutable Guard guard_;
    mutable std::atomic< std::size_t > hits_{ 0 };
    mutable std::atomic< std::size_t > misses_{ 0 };
  };

  class Node;
  using NodeList = std::vector< std::unique_ptr< Node > >;

  // Ordered children of a node, shared with every duplicate of that node.
  // Mutable until sealed by Node::init(), read-only afterwards.
  class ChildList {
  public:
    ChildList() = default;
    explicit ChildList( NodeList nodes ) : nodes_( std::move(nodes) ) {}

    const NodeList& nodes() const { return nodes_; }
    void replace( NodeList nodes );

    void seal() { sealed_.store( true ); }
    bool sealed() const { return sealed_.load(); }

  private:
    NodeList nodes_;
    std::atomic< bool > sealed_{ false };
  };

  // Compiled unit of template structure. The base behaviour runs the children
  // in document order and then writes the trailing text.
  class Node {
  public:
    // Anonymous node (root or literal text run): no name, no binding
    Node();

    // A node obtains a binding for its name from the handler, when one is
    // given. Nodes built with has_children own an (initially empty) child
    // list and reconstruct with a closing tag.
    Node( const TemplateContext& tc,
      std::shared_ptr< const ObjectHandler > handler,
      const std::string& name, const std::string& kind,
      bool has_children = false );

    // Duplication: copies the scalar fields, shares children and binding
    Node( const Node& other );
    Node& operator=( const Node& ) = delete;

    virtual ~Node() = default;

    virtual std::unique_ptr< Node > clone() const;

    // One-time recursive setup. Idempotent and safe to call concurrently.
    virtual void init();

    virtual Sink& execute( Sink& sink, const ScopeStack& scopes ) const;
    Sink& execute( Sink& sink, Scope scope ) const;

    // Regenerate the template source this node was compiled from
    virtual void identity( Sink& sink ) const;

    // Accumulate literal text that follows this node in the source
    void append( const std::string& text );

    Scope get( const ScopeStack& scopes ) const;

    // Null when the node has no child list at all
    const NodeList* children() const;
    void set_children( NodeList nodes );

    // Copy-on-extend: returns the stack with scope added innermost, or the
    // same stack contents when scope is the absent sentinel
    static ScopeStack add_scope( const ScopeStack& scopes, Scope scope );

    const std::string& name() const { return name_; }
    const std::string& kind() const { return kind_; }
    const TemplateContext& context() const { return tc_; }
    const std::shared_ptr< Binding >& binding() const { return binding_; }
    bool is_self_reference() const { return self_; }
    bool initialized() const { return initialized_.load(); }

    // Trailing text, empty if nothing was ever appended
    std::string text() const { return appended_.value_or( std::string() ); }

  protected:
    Sink& run_children( Sink& sink, const ScopeStack& scopes ) const;
    void run_identity( Sink& sink ) const;
    void tag( Sink& sink, const std::string& marker ) const;
    Sink& append_text( Sink& sink ) const;

    // Final once init() is complete
    std::optional< std::string > appended_;

    const std::shared_ptr< const ObjectHandler > handler_;
    const std::string name_;
    const TemplateContext tc_;
    const std::string kind_;
    const bool self_;
    const std::shared_ptr< Binding > binding_;
    std::shared_ptr< ChildList > children_;

  private:
    std::mutex init_mutex_;
    std::atomic< bool > initialized_{ false };
  };

  // {{name}}, {{&name}} and {{{name}}}: writes the resolved value verbatim
  class ValueNode : public Node {
  public:
    ValueNode( const TemplateContext& tc,
      std::shared_ptr< const ObjectHandler > handler,
      const std::string& name, const std::string& kind );

    std::unique_ptr< Node > clone() const override;

    using Node::execute;
    Sink& execute( Sink& sink, const ScopeStack& scopes ) const override;

    void identity( Sink& sink ) const override;
  };

  // {{#name}}...{{/name}}
  class SectionNode : public Node {
  public:
    SectionNode( const TemplateContext& tc,
      std::shared_ptr< const ObjectHandler > handler,
      const std::string& name );

    std::unique_ptr< Node > clone() const override;

    using Node::execute;
    Sink& execute( Sink& sink, const ScopeStack& scopes ) const override;
  };

  // {{^name}}...{{/name}}
  class InvertedNode : public Node {
  public:
    InvertedNode( const TemplateContext& tc,
      std::shared_ptr< const ObjectHandler > handler,
      const std::string& name );

    std::unique_ptr< Node > clone() const override;

    using Node::execute;
    Sink& execute( Sink& sink, const ScopeStack& scopes ) const override;
  };

  // {{!comment}}: the comment body is kept raw as the node name
  class CommentNode : public Node {
  public:
    CommentNode( const TemplateContext& tc, const std::string& body );

    std::unique_ptr< Node > clone() const override;

    void identity( Sink& sink ) const override;
  };

  // {{=<% %>=}}: the name holds the new delimiter pair exactly as authored
  class DelimiterNode : public Node {
  public:
    DelimiterNode( const TemplateContext& tc, const std::string& delims );

    std::unique_ptr< Node > clone() const override;

    void identity( Sink& sink ) const override;
  };

  // Compiled template: a named, initialized root node
  class Template {
  public:
    Template( const std::string& name, std::unique_ptr< Node > root );

    const std::string& name() const { return name_; }
    const Node& root() const { return *root_; }

    void render( std::ostream& out, const ordered_node& data,
      const RenderOptions& options = RenderOptions() ) const;
    std::string render( const ordered_node& data,
      const RenderOptions& options = RenderOptions() ) const;

    // Reconstructed template source
    std::string identity() const;

  private:
    std::string name_;
    std::unique_ptr< Node > root_;
  };

  struct CompilerOptions {
    std::string open = internal::DEFAULT_OPEN;
    std::string close = internal::DEFAULT_CLOSE;
  };

  // Turns template text into an initialized node tree
  class Compiler {
  public:
    explicit Compiler( std::shared_ptr< const ObjectHandler > handler
      = std::make_shared< YamlObjectHandler >(),
      const CompilerOptions& options = CompilerOptions() );

    std::unique_ptr< Template > compile( const std::string& text,
      const std::string& name = "template" ) const;
    std::unique_ptr< Template > compile( std::istream& in,
      const std::string& name ) const;

  private:
    // Open section (or the root block) whose children are being collected
    struct Frame {
      std::unique_ptr< Node > section;
      NodeList nodes;
    };

    [[noreturn]] void throw_error_at( const TemplateContext& tc,
      const std::string& msg ) const;
    void add_text( Frame& frame, const std::string& text ) const;
    TemplateContext parse_delimiters( const TemplateContext& tc,
      const std::string& delims ) const;

    std::shared_ptr< const ObjectHandler > handler_;
    CompilerOptions options_;
  };

namespace internal {

  // Divide a dotted name by PATH_DELIMITER instances
  inline std::vector< std::string > split_segments( const std::string& name ) {
    std::vector< std::string > segs;
    std::size_t start = 0;
    while ( true ) {
      std::size_t pos = name.find( PATH_DELIMITER, start );
      if ( pos == std::string::npos ) {
        segs.push_back( name.substr(start) );
        break;
      }
      segs.push_back( name.substr(start, pos - start) );
      start = pos + 1;
    }
    return segs;
  }

  inline std::string trim( const std::string& s ) {
    std::size_t b = 0, e = s.size();
    while ( b < e && std::isspace(static_cast< unsigned char >(s[b])) ) ++b;
    while ( e > b && std::isspace(static_cast< unsigned char >(s[e - 1])) ) --e;
    return s.substr( b, e - b );
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
    if ( n.is_float_number() ) return std::to_string(
      to_native_checked< double >( n )
    );

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  // One character per scope describing its node type. Two stacks with the
  // same fingerprint offer the same lookup paths to a binding.
  inline char shape_code( const ordered_node& n ) {
    if ( n.is_mapping() ) return 'M';
    if ( n.is_sequence() ) return 'S';
    if ( n.is_string() ) return 's';
    if ( n.is_integer() ) return 'i';
    if ( n.is_float_number() ) return 'f';
    if ( n.is_boolean() ) return 'b';
    return 'n';
  }

  inline std::string stack_shape( const ScopeStack& scopes ) {
    std::string shape;
    shape.reserve( scopes.size() );
    for ( const auto& s : scopes ) shape += s ? shape_code( *s ) : '-';
    return shape;
  }

  // Sections skip their body for these values
  inline bool is_falsy( const Scope& value ) {
    if ( !value || value->is_null() ) return true;
    if ( value->is_boolean() ) return !value->get_value< bool >();
    if ( value->is_string() ) {
      return to_native_checked< std::string >( *value ).empty();
    }
    if ( value->is_sequence() ) return value->size() == 0;
    return false;
  }

  inline bool is_index( const std::string& segment ) {
    if ( segment.empty() ) return false;
    for ( char c : segment ) {
      if ( !std::isdigit(static_cast< unsigned char >(c)) ) return false;
    }
    return true;
  }

  // Built-in lookup backends

  inline Scope mapping_key_lookup( const Scope& scope,
    const std::string& segment )
  {
    if ( !scope->is_mapping() || !scope->contains(segment) ) return nullptr;
    return Scope( scope, &scope->at(segment) );
  }

  inline Scope sequence_index_lookup( const Scope& scope,
    const std::string& segment )
  {
    if ( !scope->is_sequence() || !is_index(segment) ) return nullptr;
    const std::size_t idx = std::stoul( segment );
    if ( idx >= scope->size() ) return nullptr;
    return Scope( scope, &scope->at(idx) );
  }

  // "size" reports the element count of a collection or a string's length
  inline Scope size_accessor_lookup( const Scope& scope,
    const std::string& segment )
  {
    if ( segment != SIZE_ACCESSOR ) return nullptr;
    std::int64_t n = 0;
    if ( scope->is_mapping() || scope->is_sequence() ) {
      n = static_cast< std::int64_t >( scope->size() );
    }
    else if ( scope->is_string() ) {
      n = static_cast< std::int64_t >(
        to_native_checked< std::string >( *scope ).size() );
    }
    else {
      return nullptr;
    }
    return make_scope( make_node_from< std::int64_t >(n) );
  }

} // namespace mortar::internal

} // namespace mortar

// Sink member function definitions
inline mortar::Sink& mortar::Sink::write( const std::string& text ) {
  out_ << text;
  if ( !out_ ) throw RenderError( "Failed to write to the output stream" );
  return *this;
}

inline void mortar::Sink::trace( const std::string& message ) const {
  if ( !options_.debug ) return;
  std::ostream& log = options_.log ? *options_.log : std::cerr;
  log << internal::LOG_PREFIX << "debug: " << message << '\n';
}

inline std::string mortar::TemplateContext::location() const {
  std::ostringstream oss;
  oss << ( file.empty() ? "<template>" : file ) << ':' << line;
  return oss.str();
}

// YamlObjectHandler member function definitions
inline mortar::YamlObjectHandler::YamlObjectHandler() {
  lookups_.push_back( internal::mapping_key_lookup );
  lookups_.push_back( internal::sequence_index_lookup );
  lookups_.push_back( internal::size_accessor_lookup );
}

inline void mortar::YamlObjectHandler::add_lookup( Lookup lookup ) {
  lookups_.push_back( std::move(lookup) );
}

inline std::shared_ptr< mortar::Binding >
  mortar::YamlObjectHandler::create_binding( const std::string& name,
    const TemplateContext& ) const
{
  return std::make_shared< GuardedBinding >( *this, name );
}

inline mortar::Scope mortar::YamlObjectHandler::find( const Scope& scope,
  const std::string& segment ) const
{
  if ( !scope ) return nullptr;
  for ( const auto& lookup : lookups_ ) {
    Scope found;
    try {
      found = lookup( scope, segment );
    }
    catch ( const std::exception& ) {
      throw;
    }
    catch ( ... ) {
      // Bindings only recognize standard exceptions as lookup failures
      throw std::runtime_error( "Lookup of '" + segment
        + "' failed with a non-standard exception" );
    }
    if ( found ) return found;
  }
  return nullptr;
}

// GuardedBinding member function definitions
inline mortar::GuardedBinding::GuardedBinding( const ObjectHandler& handler,
  const std::string& name )
  : handler_( handler ), segments_( internal::split_segments(name) ) {}

// Resolve the name against the stack. The cached answer is only used once
// the guard confirms it still applies; otherwise a full search runs and the
// cache is refreshed. A failing lookup backend yields an absent value.
inline mortar::Scope mortar::GuardedBinding::get(
  const ScopeStack& scopes ) const
{
  if ( scopes.empty() ) return nullptr;

  try {
    const std::string shape = internal::stack_shape( scopes );

    Guard cached;
    {
      std::lock_guard< std::mutex > lock( mutex_ );
      cached = guard_;
    }

    if ( this->guard_holds(cached, shape, scopes) ) {
      hits_++;
      return this->descend( scopes[cached.depth] );
    }

    misses_++;
    std::size_t depth = 0;
    Scope found = this->search( scopes, depth );
    if ( !found ) return nullptr;

    {
      std::lock_guard< std::mutex > lock( mutex_ );
      guard_.shape = shape;
      guard_.depth = depth;
      guard_.valid = true;
    }
    return this->descend( found );
  }
  catch ( const std::exception& ) {
    return nullptr;
  }
}

// The cached hit applies when the stack has the same shape, the remembered
// scope still exposes the first segment and no scope nested inside it does
inline bool mortar::GuardedBinding::guard_holds( const Guard& guard,
  const std::string& shape, const ScopeStack& scopes ) const
{
  if ( !guard.valid || guard.shape != shape ) return false;
  if ( guard.depth >= scopes.size() ) return false;
  const std::string& first = segments_.front();
  if ( !handler_.find(scopes[guard.depth], first) ) return false;
  for ( std::size_t i = guard.depth + 1; i < scopes.size(); ++i ) {
    if ( handler_.find(scopes[i], first) ) return false;
  }
  return true;
}

// Innermost-first search for the scope exposing the first segment
inline mortar::Scope mortar::GuardedBinding::search( const ScopeStack& scopes,
  std::size_t& depth ) const
{
  for ( std::size_t i = scopes.size(); i-- > 0; ) {
    if ( handler_.find(scopes[i], segments_.front()) ) {
      depth = i;
      return scopes[ i ];
    }
  }
  return nullptr;
}

// Walk the remaining dotted segments from the scope that matched the first
inline mortar::Scope mortar::GuardedBinding::descend( Scope found ) const {
  for ( const auto& seg : segments_ ) {
    found = handler_.find( found, seg );
    if ( !found ) return nullptr;
  }
  return found;
}

// ChildList member function definitions
inline void mortar::ChildList::replace( NodeList nodes ) {
  if ( this->sealed() ) {
    throw RenderError( "Cannot replace children of an initialized node" );
  }
  nodes_ = std::move( nodes );
}

// Node member function definitions
inline mortar::Node::Node()
  : handler_(), name_(), tc_(), kind_(), self_( false ), binding_(),
  children_() {}

inline mortar::Node::Node( const TemplateContext& tc,
  std::shared_ptr< const ObjectHandler > handler, const std::string& name,
  const std::string& kind, bool has_children )
  : handler_( std::move(handler) ), name_( name ), tc_( tc ), kind_( kind ),
  self_( name == internal::SELF_NAME ),
  binding_( handler_ ? handler_->create_binding(name, tc) : nullptr ),
  children_( has_children ? std::make_shared< ChildList >() : nullptr ) {}

inline mortar::Node::Node( const Node& other )
  : appended_( other.appended_ ), handler_( other.handler_ ),
  name_( other.name_ ), tc_( other.tc_ ), kind_( other.kind_ ),
  self_( other.self_ ), binding_( other.binding_ ),
  children_( other.children_ ) {}

// Derived kinds must duplicate themselves; falling back to the base copy
// would slice them
inline std::unique_ptr< mortar::Node > mortar::Node::clone() const {
  if ( typeid(*this) != typeid(Node) ) {
    std::ostringstream oss;
    oss << "Node kind '" << kind_ << "' (" << typeid(*this).name()
      << ") does not support duplication";
    throw RenderError( oss.str() );
  }
  return std::make_unique< Node >( *this );
}

inline void mortar::Node::init() {
  std::lock_guard< std::mutex > lock( init_mutex_ );
  if ( initialized_.load() ) return;
  if ( children_ ) {
    for ( const auto& child : children_->nodes() ) child->init();
    children_->seal();
  }
  initialized_.store( true );
}

inline const mortar::NodeList* mortar::Node::children() const {
  return children_ ? &children_->nodes() : nullptr;
}

inline void mortar::Node::set_children( NodeList nodes ) {
  if ( !children_ ) {
    if ( initialized_.load() ) {
      throw RenderError( "Cannot set children of an initialized node" );
    }
    children_ = std::make_shared< ChildList >( std::move(nodes) );
    return;
  }
  children_->replace( std::move(nodes) );
}

// Retrieve the first value in the stack of scopes that matches this node's
// name, searching from the innermost scope outwards. The self reference
// short-circuits to the innermost scope without consulting the binding.
inline mortar::Scope mortar::Node::get( const ScopeStack& scopes ) const {
  if ( self_ ) return scopes.empty() ? nullptr : scopes.back();
  if ( !binding_ ) return nullptr;
  return binding_->get( scopes );
}

inline mortar::Sink& mortar::Node::execute( Sink& sink, Scope scope ) const {
  ScopeStack scopes;
  if ( scope ) scopes.push_back( std::move(scope) );
  return this->execute( sink, scopes );
}

// The default behaviour is to run the children and write the trailing text
inline mortar::Sink& mortar::Node::execute( Sink& sink,
  const ScopeStack& scopes ) const
{
  return this->append_text( this->run_children(sink, scopes) );
}

inline void mortar::Node::identity( Sink& sink ) const {
  if ( !name_.empty() ) {
    this->tag( sink, kind_ );
    if ( children_ ) {
      this->run_identity( sink );
      this->tag( sink, internal::CLOSE_MARKER );
    }
  }
  else if ( children_ ) {
    this->run_identity( sink );
  }
  this->append_text( sink );
}

inline void mortar::Node::append( const std::string& text ) {
  if ( initialized_.load() ) {
    throw RenderError( "Cannot append text to an initialized node ("
      + tc_.location() + ")" );
  }
  if ( !appended_ ) {
    appended_ = text;
  } else {
    *appended_ += text;
  }
}

inline mortar::ScopeStack mortar::Node::add_scope( const ScopeStack& scopes,
  Scope scope )
{
  if ( !scope ) return scopes;
  ScopeStack extended;
  extended.reserve( scopes.size() + 1 );
  extended.insert( extended.end(), scopes.begin(), scopes.end() );
  extended.push_back( std::move(scope) );
  return extended;
}

inline mortar::Sink& mortar::Node::run_children( Sink& sink,
  const ScopeStack& scopes ) const
{
  if ( children_ ) {
    for ( const auto& child : children_->nodes() ) {
      child->execute( sink, scopes );
    }
  }
  return sink;
}

inline void mortar::Node::run_identity( Sink& sink ) const {
  for ( const auto& child : children_->nodes() ) child->identity( sink );
}

inline void mortar::Node::tag( Sink& sink, const std::string& marker ) const {
  sink.write( tc_.open ).write( marker ).write( name_ ).write( tc_.close );
}

inline mortar::Sink& mortar::Node::append_text( Sink& sink ) const {
  if ( appended_ ) sink.write( *appended_ );
  return sink;
}

// ValueNode member function definitions
inline mortar::ValueNode::ValueNode( const TemplateContext& tc,
  std::shared_ptr< const ObjectHandler > handler, const std::string& name,
  const std::string& kind )
  : Node( tc, std::move(handler), name, kind ) {}

inline std::unique_ptr< mortar::Node > mortar::ValueNode::clone() const {
  return std::make_unique< ValueNode >( *this );
}

inline mortar::Sink& mortar::ValueNode::execute( Sink& sink,
  const ScopeStack& scopes ) const
{
  Scope value = this->get( scopes );
  if ( value && !value->is_null() ) {
    sink.write( internal::to_string_any(*value) );
  }
  else if ( sink.options().debug ) {
    sink.trace( "'" + name_ + "' at " + tc_.location()
      + " resolved to nothing" );
  }
  return this->append_text( sink );
}

// The triple form also needs its inner closing brace back
inline void mortar::ValueNode::identity( Sink& sink ) const {
  if ( kind_ != internal::TRIPLE_OPEN_MARKER ) {
    Node::identity( sink );
    return;
  }
  sink.write( tc_.open ).write( kind_ ).write( name_ )
    .write( internal::TRIPLE_CLOSE_MARKER ).write( tc_.close );
  this->append_text( sink );
}

// SectionNode member function definitions
inline mortar::SectionNode::SectionNode( const TemplateContext& tc,
  std::shared_ptr< const ObjectHandler > handler, const std::string& name )
  : Node( tc, std::move(handler), name, internal::SECTION_MARKER, true ) {}

inline std::unique_ptr< mortar::Node > mortar::SectionNode::clone() const {
  return std::make_unique< SectionNode >( *this );
}

// Sequences run the body once per element, other truthy values run it once
// with the value pushed as the innermost scope
inline mortar::Sink& mortar::SectionNode::execute( Sink& sink,
  const ScopeStack& scopes ) const
{
  Scope value = this->get( scopes );
  if ( internal::is_falsy(value) ) {
    if ( !value ) {
      sink.trace( "section '" + name_ + "' at " + tc_.location()
        + " resolved to nothing" );
    }
  }
  else if ( value->is_sequence() ) {
    for ( std::size_t i = 0; i < value->size(); ++i ) {
      this->run_children( sink,
        add_scope(scopes, Scope( value, &value->at(i) )) );
    }
  }
  else {
    this->run_children( sink, add_scope(scopes, value) );
  }
  return this->append_text( sink );
}

// InvertedNode member function definitions
inline mortar::InvertedNode::InvertedNode( const TemplateContext& tc,
  std::shared_ptr< const ObjectHandler > handler, const std::string& name )
  : Node( tc, std::move(handler), name, internal::INVERTED_MARKER, true ) {}

inline std::unique_ptr< mortar::Node > mortar::InvertedNode::clone() const {
  return std::make_unique< InvertedNode >( *this );
}

inline mortar::Sink& mortar::InvertedNode::execute( Sink& sink,
  const ScopeStack& scopes ) const
{
  if ( internal::is_falsy(this->get(scopes)) ) {
    this->run_children( sink, scopes );
  }
  return this->append_text( sink );
}

// CommentNode member function definitions
inline mortar::CommentNode::CommentNode( const TemplateContext& tc,
  const std::string& body )
  : Node( tc, nullptr, body, internal::COMMENT_MARKER ) {}

inline std::unique_ptr< mortar::Node > mortar::CommentNode::clone() const {
  return std::make_unique< CommentNode >( *this );
}

// An empty comment still has a tag to reconstruct
inline void mortar::CommentNode::identity( Sink& sink ) const {
  this->tag( sink, kind_ );
  this->append_text( sink );
}

// DelimiterNode member function definitions
inline mortar::DelimiterNode::DelimiterNode( const TemplateContext& tc,
  const std::string& delims )
  : Node( tc, nullptr, delims, internal::DELIMITER_MARKER ) {}

inline std::unique_ptr< mortar::Node > mortar::DelimiterNode::clone() const {
  return std::make_unique< DelimiterNode >( *this );
}

// Written with the delimiters that were active before the change
inline void mortar::DelimiterNode::identity( Sink& sink ) const {
  sink.write( tc_.open ).write( kind_ ).write( name_ ).write( kind_ )
    .write( tc_.close );
  this->append_text( sink );
}

// Template member function definitions
inline mortar::Template::Template( const std::string& name,
  std::unique_ptr< Node > root )
  : name_( name ), root_( std::move(root) )
{
  if ( !root_ ) throw RenderError( "Template '" + name_ + "' has no root" );
  root_->init();
}

inline void mortar::Template::render( std::ostream& out,
  const ordered_node& data, const RenderOptions& options ) const
{
  Sink sink( out, options );
  root_->execute( sink, make_scope(data) );
}

inline std::string mortar::Template::render( const ordered_node& data,
  const RenderOptions& options ) const
{
  std::ostringstream oss;
  this->render( oss, data, options );
  return oss.str();
}

inline std::string mortar::Template::identity() const {
  std::ostringstream oss;
  Sink sink( oss );
  root_->identity( sink );
  return oss.str();
}

// Compiler member function definitions
inline mortar::Compiler::Compiler(
  std::shared_ptr< const ObjectHandler > handler,
  const CompilerOptions& options )
  : handler_( std::move(handler) ), options_( options )
{
  if ( options_.open.empty() || options_.close.empty() ) {
    throw std::runtime_error( "Template delimiters must not be empty" );
  }
}

// Read from an input stream until end-of-file, then compile the result
inline std::unique_ptr< mortar::Template > mortar::Compiler::compile(
  std::istream& in, const std::string& name ) const
{
  std::ostringstream ss;
  ss << in.rdbuf();
  return this->compile( ss.str(), name );
}

inline std::unique_ptr< mortar::Template > mortar::Compiler::compile(
  const std::string& text, const std::string& name ) const
{
  using namespace internal;

  TemplateContext tc;
  tc.open = options_.open;
  tc.close = options_.close;
  tc.file = name;
  tc.line = 1;

  // frames[0] collects the root's children
  std::vector< Frame > frames;
  frames.emplace_back();

  std::size_t pos = 0;
  while ( pos < text.size() ) {
    const std::size_t start = text.find( tc.open, pos );
    const std::size_t literal_end
      = ( start == std::string::npos ) ? text.size() : start;

    // Literal run up to the next tag
    const std::string literal = text.substr( pos, literal_end - pos );
    this->add_text( frames.back(), literal );
    for ( char c : literal ) if ( c == '\n' ) tc.line++;
    if ( start == std::string::npos ) break;

    // {{{name}}} closes with "}" followed by the close delimiter
    const std::size_t body = start + tc.open.size();
    const bool triple = text.compare( body, TRIPLE_OPEN_MARKER.size(),
      TRIPLE_OPEN_MARKER ) == 0;
    const std::string closer
      = triple ? TRIPLE_CLOSE_MARKER + tc.close : tc.close;
    const std::size_t end = text.find( closer, body );
    if ( end == std::string::npos ) {
      throw_error_at( tc, "Unclosed tag, expected '" + closer + "'" );
    }
    const std::string content = text.substr( body, end - body );
    pos = end + closer.size();

    const std::string marker = content.empty()
      ? std::string() : content.substr( 0, 1 );
    std::unique_ptr< Node > node;

    if ( marker == COMMENT_MARKER ) {
      node = std::make_unique< CommentNode >( tc, content.substr(1) );
    }
    else if ( marker == DELIMITER_MARKER ) {
      const std::string delims = content.size() >= 2
        && content.back() == DELIMITER_MARKER[0]
        ? content.substr( 1, content.size() - 2 ) : std::string();
      TemplateContext next = this->parse_delimiters( tc, delims );
      node = std::make_unique< DelimiterNode >( tc, delims );
      tc.open = next.open;
      tc.close = next.close;
    }
    else if ( marker == SECTION_MARKER || marker == INVERTED_MARKER ) {
      const std::string tag_name = trim( content.substr(1) );
      if ( tag_name.empty() ) throw_error_at( tc, "Section tag has no name" );
      Frame frame;
      if ( marker == SECTION_MARKER ) {
        frame.section = std::make_unique< SectionNode >( tc, handler_,
          tag_name );
      } else {
        frame.section = std::make_unique< InvertedNode >( tc, handler_,
          tag_name );
      }
      frames.push_back( std::move(frame) );
    }
    else if ( marker == CLOSE_MARKER ) {
      const std::string tag_name = trim( content.substr(1) );
      if ( frames.size() < 2 ) {
        throw_error_at( tc, "Closing tag '" + tag_name
          + "' has no matching section" );
      }
      if ( frames.back().section->name() != tag_name ) {
        throw_error_at( tc, "Closing tag '" + tag_name
          + "' does not match open section '"
          + frames.back().section->name() + "'" );
      }
      Frame done = std::move( frames.back() );
      frames.pop_back();
      done.section->set_children( std::move(done.nodes) );
      node = std::move( done.section );
    }
    else if ( marker == PARTIAL_MARKER ) {
      throw_error_at( tc, "Partial tags are not supported" );
    }
    else {
      const bool unescaped = ( marker == UNESCAPED_MARKER || triple );
      const std::string tag_name
        = trim( unescaped ? content.substr(1) : content );
      if ( tag_name.empty() ) throw_error_at( tc, "Empty tag" );
      node = std::make_unique< ValueNode >( tc, handler_, tag_name,
        triple ? TRIPLE_OPEN_MARKER
        : unescaped ? UNESCAPED_MARKER : VALUE_MARKER );
    }

    for ( char c : content ) if ( c == '\n' ) tc.line++;
    if ( node ) frames.back().nodes.push_back( std::move(node) );
  }

  if ( frames.size() > 1 ) {
    const Node& open = *frames.back().section;
    throw_error_at( open.context(), "Unclosed section '" + open.name() + "'" );
  }

  auto root = std::make_unique< Node >();
  root->set_children( std::move(frames.front().nodes) );
  return std::make_unique< Template >( name, std::move(root) );
}

// Literal text trails the previous node of the block; a block that starts
// with text gets an anonymous node to carry it
inline void mortar::Compiler::add_text( Frame& frame,
  const std::string& text ) const
{
  if ( text.empty() ) return;
  if ( frame.nodes.empty() ) frame.nodes.push_back( std::make_unique< Node >() );
  frame.nodes.back()->append( text );
}

// Parse "<open> <close>" from a set-delimiter tag
inline mortar::TemplateContext mortar::Compiler::parse_delimiters(
  const TemplateContext& tc, const std::string& delims ) const
{
  std::istringstream iss( delims );
  std::string open, close, extra;
  if ( !(iss >> open >> close) || (iss >> extra)
    || open.find(internal::DELIMITER_MARKER) != std::string::npos
    || close.find(internal::DELIMITER_MARKER) != std::string::npos )
  {
    throw_error_at( tc, "Malformed delimiter change '" + delims + "'" );
  }
  TemplateContext next = tc;
  next.open = open;
  next.close = close;
  return next;
}

[[noreturn]] inline void mortar::Compiler::throw_error_at(
  const TemplateContext& tc, const std::string& msg ) const
{
  std::ostringstream oss;
  oss << tc.location() << ": " << msg;
  throw std::runtime_error( oss.str() );
}
