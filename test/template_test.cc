#include <thread>

#include <gtest/gtest.h>

#include "test_util.hh"

using namespace mortar;
using mortar::test::yaml;

namespace {

  std::string render( const std::string& source, const std::string& data ) {
    Compiler compiler;
    return compiler.compile( source )->render( yaml(data) );
  }

} // anonymous namespace

TEST( TemplateTest, RendersVariables ) {
  EXPECT_EQ( render("Hello {{name}}, you are {{age}}.", "name: Ada\nage: 36\n"),
    "Hello Ada, you are 36." );
  EXPECT_EQ( render("{{flag}}/{{&flag}}", "flag: true\n"), "true/true" );
}

TEST( TemplateTest, MissingAndNullValuesRenderNothing ) {
  EXPECT_EQ( render("[{{missing}}][{{nothing}}]", "nothing: null\n"),
    "[][]" );
}

TEST( TemplateTest, SectionIteratesSequences ) {
  EXPECT_EQ( render("{{#items}}<{{.}}>{{/items}}",
    "items:\n  - a\n  - b\n  - c\n"), "<a><b><c>" );
}

TEST( TemplateTest, SectionPushesMappingScope ) {
  const std::string data =
    "greeting: Hi\n"
    "person:\n"
    "  name: Grace\n";
  EXPECT_EQ( render("{{#person}}{{greeting}} {{name}}{{/person}}!", data),
    "Hi Grace!" );
}

TEST( TemplateTest, InnerScopeShadowsOuter ) {
  const std::string data =
    "name: outer\n"
    "items:\n"
    "  - name: first\n"
    "  - other: 1\n";
  EXPECT_EQ( render("{{#items}}{{name}};{{/items}}{{name}}", data),
    "first;outer;outer" );
}

TEST( TemplateTest, FalsySectionsAreSkipped ) {
  const std::string data =
    "no: false\n"
    "empty: \"\"\n"
    "none: null\n"
    "list: []\n";
  EXPECT_EQ( render("{{#no}}x{{/no}}{{#empty}}x{{/empty}}{{#none}}x{{/none}}"
    "{{#list}}x{{/list}}{{#missing}}x{{/missing}}.", data), "." );
}

TEST( TemplateTest, ScalarSectionBecomesSelf ) {
  EXPECT_EQ( render("{{#word}}[{{.}}]{{/word}}", "word: hello\n"), "[hello]" );
}

TEST( TemplateTest, InvertedSections ) {
  const std::string data = "list: []\nfull:\n  - 1\n";
  EXPECT_EQ( render("{{^list}}none{{/list}}{{^full}}none{{/full}}"
    "{{^missing}}!{{/missing}}", data), "none!" );
}

TEST( TemplateTest, NestedSectionsAndDottedNames ) {
  const std::string data =
    "team:\n"
    "  lead:\n"
    "    name: Linus\n"
    "  members:\n"
    "    - name: Ann\n"
    "      tags:\n"
    "        - x\n"
    "        - y\n"
    "    - name: Bob\n"
    "      tags: []\n";
  const std::string src =
    "{{team.lead.name}}:{{#team.members}} {{name}}({{#tags}}{{.}}{{/tags}})"
    "{{/team.members}} n={{team.members.size}}";
  EXPECT_EQ( render(src, data), "Linus: Ann(xy) Bob() n=2" );
}

TEST( TemplateTest, CommentsAndDelimitersRenderOnlyText ) {
  EXPECT_EQ( render("a{{! ignored }}b{{=<% %>=}}c<%v%>{{v}}", "v: 1\n"),
    "abc1{{v}}" );
}

TEST( TemplateTest, IdentityDoesNotNeedData ) {
  Compiler compiler;
  const std::string src = "{{#a}}{{b}}{{/a}} {{^c}}d{{/c}}";
  auto tmpl = compiler.compile( src );
  EXPECT_EQ( tmpl->identity(), src );
  EXPECT_EQ( tmpl->render(yaml("a:\n  b: 0\n")), "0 d" );
  EXPECT_EQ( tmpl->identity(), src );
}

TEST( TemplateTest, RendersToStream ) {
  Compiler compiler;
  auto tmpl = compiler.compile( "{{x}}-{{y}}" );
  std::ostringstream oss;
  oss << "> ";
  tmpl->render( oss, yaml("x: 1\ny: 2\n") );
  EXPECT_EQ( oss.str(), "> 1-2" );
}

TEST( TemplateTest, DebugTracesUnresolvedNames ) {
  Compiler compiler;
  auto tmpl = compiler.compile( "{{a}}\n{{missing}}{{#gone}}{{/gone}}", "page" );

  std::ostringstream log;
  RenderOptions options;
  options.debug = true;
  options.log = &log;
  EXPECT_EQ( tmpl->render(yaml("a: 1\n"), options), "1\n" );
  EXPECT_NE( log.str().find("[mortar] debug: 'missing' at page:2 resolved"),
    std::string::npos );
  EXPECT_NE( log.str().find("section 'gone' at page:2"), std::string::npos );
  EXPECT_EQ( log.str().find("'a'"), std::string::npos );
}

TEST( TemplateTest, NoTracingByDefault ) {
  Compiler compiler;
  auto tmpl = compiler.compile( "{{missing}}" );

  std::ostringstream log;
  RenderOptions options;
  options.log = &log;
  EXPECT_EQ( tmpl->render(yaml("a: 1\n"), options), "" );
  EXPECT_TRUE( log.str().empty() );
}

TEST( TemplateTest, ConcurrentRendersWithDifferentOptions ) {
  Compiler compiler;
  auto tmpl = compiler.compile(
    "{{#rows}}{{id}}:{{label}}{{^label}}-{{/label}};{{/rows}}{{missing}}" );

  std::vector< std::string > outputs( 8 );
  std::vector< std::ostringstream > logs( 8 );
  std::vector< std::thread > threads;
  for ( int t = 0; t < 8; ++t ) {
    threads.emplace_back( [&, t]() {
      std::ostringstream data;
      data << "rows:\n";
      for ( int i = 0; i < 3; ++i ) {
        data << "  - id: " << ( t * 10 + i ) << "\n";
        if ( i % 2 == 0 ) data << "    label: L" << t << "\n";
      }
      RenderOptions options;
      options.debug = ( t % 2 == 0 );
      options.log = &logs[ t ];
      for ( int k = 0; k < 50; ++k ) {
        outputs[ t ] = tmpl->render( yaml(data.str()), options );
      }
    } );
  }
  for ( auto& th : threads ) th.join();

  for ( int t = 0; t < 8; ++t ) {
    std::ostringstream expected;
    expected << t * 10 << ":L" << t << ";" << t * 10 + 1 << ":-;"
      << t * 10 + 2 << ":L" << t << ";";
    EXPECT_EQ( outputs[t], expected.str() );
    EXPECT_EQ( logs[t].str().empty(), t % 2 != 0 );
  }
}

TEST( TemplateTest, DuplicatedSubtreeRendersLikeItsSource ) {
  Compiler compiler;
  auto tmpl = compiler.compile( "{{#s}}{{v}}{{/s}}" );
  const Node& section = *( *tmpl->root().children() )[0];

  std::unique_ptr< Node > copy = section.clone();
  copy->append( " (copy)" );
  copy->init();

  ScopeStack scopes{ make_scope(yaml("s:\n  v: 7\n")) };
  EXPECT_EQ( test::run(*copy, scopes), "7 (copy)" );
  EXPECT_EQ( test::run(section, scopes), "7" );
  EXPECT_EQ( test::identity_of(*copy), "{{#s}}{{v}}{{/s}} (copy)" );
}

TEST( TemplateTest, NullRootIsRejected ) {
  EXPECT_THROW( Template("broken", nullptr), RenderError );
}
