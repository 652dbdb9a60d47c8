#include "./stages.hpp"

#include "./file.hpp"
#include "./pipeline.hpp"
#include "./string_io.hpp"

#include <catch2/catch.hpp>

#include <csignal>
#include <filesystem>
#include <functional>
#include <regex>
#include <string>
#include <vector>

namespace stages = pipekit::stages;

using lines_t = std::vector<std::string>;

namespace {

/// Run `text` through a single plain stage and return its output
std::string through(std::string text, pipekit::stage s) {
    auto result = pipekit::pipeline::echo(std::move(text)).filter(std::move(s)).string();
    result.throw_if_error();
    return result.value;
}

auto THIS_DIR = std::filesystem::weakly_canonical(std::filesystem::path(__FILE__).parent_path());

}  // namespace

TEST_CASE("Sources ignore their input") {
    CHECK(through("ignored", stages::echo("replacement")) == "replacement");
    CHECK(through("ignored", stages::from_lines({"a", "b"})) == "a\nb\n");
    CHECK(through("", stages::from_lines({})) == "");
}

TEST_CASE("Read a file") {
    auto content = through("", stages::cat_file(__FILE__));
    CHECK(content == pipekit::file::read(__FILE__));
    CHECK_THROWS_AS(through("", stages::cat_file(THIS_DIR / "no-such-file.txt")),
                    pipekit::file_not_found_error);
}

TEST_CASE("Match and reject lines") {
    const std::string input = "apple pie\nbanana split\ncherry pie\n";
    CHECK(through(input, stages::match("pie")) == "apple pie\ncherry pie\n");
    CHECK(through(input, stages::reject("pie")) == "banana split\n");
    CHECK(through(input, stages::match("")) == input);
    CHECK(through(input, stages::reject("")) == "");
}

TEST_CASE("Replace text in each line") {
    CHECK(through("a-b-c\nd-e\n", stages::replace("-", "+")) == "a+b+c\nd+e\n");
    CHECK(through("aaaa\n", stages::replace("aa", "b")) == "bb\n");
    CHECK(through("hello\n", stages::replace("xyz", "!")) == "hello\n");
    CHECK(through("ab\n", stages::replace("", "-")) == "-a-b-\n");
}

TEST_CASE("Match and reject lines by regular expression") {
    const std::string input = "apple 1\nbanana\ncherry 22\n";
    CHECK(through(input, stages::match_regex(std::regex("[0-9]+"))) == "apple 1\ncherry 22\n");
    CHECK(through(input, stages::reject_regex(std::regex("[0-9]+"))) == "banana\n");
    CHECK(through(input, stages::match_regex(std::regex("^b"))) == "banana\n");
    CHECK(through(input, stages::match_regex(std::regex("nothing"))) == "");
}

TEST_CASE("Replace regular expression matches in each line") {
    CHECK(through("a1b22\nplain\n", stages::replace_regex(std::regex("[0-9]+"), "#"))
          == "a#b#\nplain\n");
    CHECK(through("key=value\n",
                  stages::replace_regex(std::regex("(\\w+)=(\\w+)"), "$2=$1"))
          == "value=key\n");
}

TEST_CASE("Take the first lines") {
    auto lines = pipekit::pipeline::echo("1\n2\n3\n4\n5\n").filter(stages::first(2)).lines();
    CHECK(lines.value == lines_t{"1", "2"});

    CHECK(through("1\n2\n", stages::first(10)) == "1\n2\n");
    CHECK(through("1\n2\n", stages::first(0)) == "");
    CHECK(through("1\n2\n", stages::first(-1)) == "");
}

TEST_CASE("Take the last lines") {
    CHECK(through("1\n2\n3\n4\n5\n", stages::last(2)) == "4\n5\n");
    CHECK(through("1\n2\n", stages::last(10)) == "1\n2\n");
    CHECK(through("1\n2\n", stages::last(0)) == "");
    CHECK(through("", stages::last(3)) == "");
}

TEST_CASE("Count line frequencies") {
    auto lines = pipekit::pipeline::echo("b\na\nb\na\na\n").filter(stages::freq()).lines();
    CHECK(lines.value == lines_t{"3 a", "2 b"});

    std::string many;
    for (int i = 0; i < 12; ++i) {
        many += "x\n";
    }
    many += "z\ny\n";
    CHECK(through(many, stages::freq()) == "12 x\n 1 y\n 1 z\n");
    CHECK(through("", stages::freq()) == "");
}

TEST_CASE("Count lines") {
    CHECK(through("a\nb\nc\n", stages::count_lines()) == "3\n");
    CHECK(through("a\nb\nc", stages::count_lines()) == "3\n");
    CHECK(through("", stages::count_lines()) == "0\n");
}

TEST_CASE("Select a column") {
    const std::string input = "  1  root   init\n2 daemon\n\n3\tuser\tshell\n";
    CHECK(through(input, stages::column(1)) == "1\n2\n3\n");
    CHECK(through(input, stages::column(3)) == "init\nshell\n");
    CHECK(through(input, stages::column(0)) == "");
    CHECK(through(input, stages::column(9)) == "");
}

TEST_CASE("Join lines") {
    CHECK(through("a\nb\nc\n", stages::join()) == "a b c\n");
    CHECK(through("single", stages::join()) == "single\n");
    CHECK(through("", stages::join()) == "\n");
}

TEST_CASE("Base names") {
    const std::string input = "/usr/local/bin/foo\nbar\n/\n\na/b/\n";
    CHECK(pipekit::pipeline::echo(input).filter(stages::basename()).lines().value
          == lines_t{"foo", "bar", "/", ".", "b"});
}

TEST_CASE("Directory names") {
    const std::string input
        = "/usr/local/bin/foo\nfoo\n/foo/\n\n./a/b\na//b/../c/d\n/\n./foo\n";
    CHECK(pipekit::pipeline::echo(input).filter(stages::dirname()).lines().value
          == lines_t{"/usr/local/bin", ".", "/", ".", "./a", "a/c", "/", "."});
}

TEST_CASE("Clean paths") {
    CHECK(stages::clean_path("") == ".");
    CHECK(stages::clean_path("a/b/") == "a/b");
    CHECK(stages::clean_path("/a//b/./c") == "/a/b/c");
    CHECK(stages::clean_path("a/../..") == "..");
    CHECK(stages::clean_path("/../a") == "/a");
    CHECK(stages::clean_path("///") == "/");
}

TEST_CASE("Concatenate files named by lines") {
    auto dir = std::filesystem::temp_directory_path();
    auto one = dir / "pipekit-concat-1.txt";
    auto two = dir / "pipekit-concat-2.txt";
    pipekit::file::write(one, std::string_view("first\n"));
    pipekit::file::write(two, std::string_view("second\n"));

    auto input = one.string() + "\n" + (dir / "pipekit-concat-missing.txt").string() + "\n"
        + two.string() + "\n";
    CHECK(through(input, stages::concat()) == "first\nsecond\n");

    std::filesystem::remove(one);
    std::filesystem::remove(two);
}

TEST_CASE("Tee into other streams") {
    pipekit::string_writer copy1;
    pipekit::string_writer copy2;
    auto out = through("some data\n", stages::tee({std::ref<pipekit::byte_io_stream>(copy1),
                                                   std::ref<pipekit::byte_io_stream>(copy2)}));
    CHECK(out == "some data\n");
    CHECK(copy1.str() == "some data\n");
    CHECK(copy2.str() == "some data\n");

    CHECK(through("alone", stages::tee({})) == "alone");
}

TEST_CASE("Transform each line") {
    auto out = through("a\nbb\n", stages::transform_lines([](std::string_view line) {
                           return std::to_string(line.size());
                       }));
    CHECK(out == "1\n2\n");
}

TEST_CASE("Accumulate output line by line") {
    auto keep_odd = [](std::string_view line, std::string& acc) {
        if (line.size() != 2) {
            acc.append(line).append(";");
        }
    };
    auto out = through("a\nbb\nccc\n", stages::each_line(keep_odd));
    CHECK(out == "a;ccc;");
    CHECK(through("", stages::each_line([](std::string_view, std::string& acc) {
                      acc.append("x");
                  }))
          == "");
}

namespace {

/// A fresh directory tree in the temp directory, removed again at scope exit:
///
///     <root>/b.txt
///     <root>/a.txt
///     <root>/sub/c.txt
///     <root>/sub/deeper/d.log
struct scratch_tree {
    std::filesystem::path root;

    explicit scratch_tree(std::string_view name)
        : root(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root / "sub" / "deeper");
        pipekit::file::write(root / "b.txt", std::string_view("b"));
        pipekit::file::write(root / "a.txt", std::string_view("a"));
        pipekit::file::write(root / "sub" / "c.txt", std::string_view("c"));
        pipekit::file::write(root / "sub" / "deeper" / "d.log", std::string_view("d"));
    }

    ~scratch_tree() { std::filesystem::remove_all(root); }

    std::string operator/(std::string_view rel) const {
        return root.string() + "/" + std::string(rel);
    }
};

}  // namespace

TEST_CASE("List files") {
    scratch_tree tree{"pipekit-list-test"};
    auto         root = tree.root.string();

    CHECK(through("", stages::list_files(root))
          == (tree / "a.txt") + "\n" + (tree / "b.txt") + "\n" + (tree / "sub") + "\n");
    // A trailing slash does not double up in the output
    CHECK(through("", stages::list_files(root + "/"))
          == (tree / "a.txt") + "\n" + (tree / "b.txt") + "\n" + (tree / "sub") + "\n");
    CHECK(through("", stages::list_files(tree / "a.txt")) == (tree / "a.txt") + "\n");
    CHECK(through("", stages::list_files(tree / "*.txt"))
          == (tree / "a.txt") + "\n" + (tree / "b.txt") + "\n");
    CHECK(through("", stages::list_files(tree / "*/*.txt")) == (tree / "sub/c.txt") + "\n");
    CHECK(through("", stages::list_files(tree / "*.none")) == "");
    CHECK_THROWS_AS(through("", stages::list_files(tree / "missing")),
                    std::filesystem::filesystem_error);
}

TEST_CASE("Find files recursively") {
    scratch_tree tree{"pipekit-find-test"};
    auto         root = tree.root.string();

    CHECK(through("", stages::find_files(root))
          == (tree / "a.txt") + "\n" + (tree / "b.txt") + "\n" + (tree / "sub/c.txt") + "\n"
              + (tree / "sub/deeper/d.log") + "\n");
    CHECK(through("", stages::find_files(tree / "sub/deeper"))
          == (tree / "sub/deeper/d.log") + "\n");
    // A plain file is its own result
    CHECK(through("", stages::find_files(tree / "b.txt")) == (tree / "b.txt") + "\n");
    CHECK_THROWS_AS(through("", stages::find_files(tree / "missing")),
                    std::filesystem::filesystem_error);
}

TEST_CASE("Write and append files") {
    auto path = std::filesystem::temp_directory_path() / "pipekit-write-test.txt";
    std::filesystem::remove(path);

    CHECK(through("hello\n", stages::write_file(path)) == "6");
    CHECK(pipekit::file::read(path) == "hello\n");

    CHECK(through("world\n", stages::append_file(path)) == "6");
    CHECK(pipekit::file::read(path) == "hello\nworld\n");

    CHECK(through("replaced", stages::write_file(path)) == "8");
    CHECK(pipekit::file::read(path) == "replaced");

    std::filesystem::remove(path);
    CHECK(through("new", stages::append_file(path)) == "3");
    CHECK(pipekit::file::read(path) == "new");
    std::filesystem::remove(path);
}

TEST_CASE("Check that a path exists") {
    CHECK(through("", stages::if_exists(__FILE__)) == "");
    CHECK_THROWS_AS(through("", stages::if_exists(THIS_DIR / "nothing-here")),
                    std::filesystem::filesystem_error);
}

TEST_CASE("Fail with an exit code") {
    try {
        (void)through("", stages::exit_with(4, "four"));
        FAIL_CHECK("No exception was thrown");
    } catch (const pipekit::exit_error& e) {
        CHECK(e.exit_code() == 4);
        CHECK(std::string(e.what()) == "four");
    }
}

TEST_CASE("Split a command line") {
    using args = std::vector<std::string>;
    CHECK(stages::split_command_line("") == args{});
    CHECK(stages::split_command_line("  ls   -l  ") == args{"ls", "-l"});
    CHECK(stages::split_command_line("echo 'hello world'") == args{"echo", "hello world"});
    CHECK(stages::split_command_line(R"(echo "a \"b\" \$c \d")") == args{"echo", R"(a "b" $c \d)"});
    CHECK(stages::split_command_line(R"(echo a\ b)") == args{"echo", "a b"});
    CHECK(stages::split_command_line("echo '' \"\"") == args{"echo", "", ""});
    CHECK(stages::split_command_line("x'y'\"z\"") == args{"xyz"});
    CHECK_THROWS_AS(stages::split_command_line("echo 'oops"), std::invalid_argument);
    CHECK_THROWS_AS(stages::split_command_line("echo \"oops"), std::invalid_argument);
    CHECK_THROWS_AS(stages::split_command_line("echo oops\\"), std::invalid_argument);
}

TEST_CASE("Run a program as a filter") {
    pipekit::string_writer diag;
    pipekit::pipeline      p = pipekit::pipeline::echo("one\ntwo\n");
    p.with_stderr(diag);
    p.pipe(stages::exec(std::vector<std::string>{"/bin/sh", "-c", "cat; echo oops >&2"}));
    auto result = p.string();
    CHECK(result.ok());
    CHECK(result.value == "one\ntwo\n");
    CHECK(diag.str() == "oops\n");
}

TEST_CASE("A program that does not read its input") {
    std::string big(1024 * 1024, 'x');
    auto        result
        = pipekit::pipeline::echo(big).pipe(stages::exec("sh -c 'echo done'")).string();
    CHECK(result.ok());
    CHECK(result.value == "done\n");
}

TEST_CASE("A program whose output is abandoned is reaped") {
    // `yes` never ends by itself. Once first() stops reading, the stage stops listening and
    // the program dies of a broken pipe.
    auto result = pipekit::pipeline::exec("yes").filter(stages::first(2)).lines();
    CHECK(result.ok());
    CHECK(result.value == lines_t{"y", "y"});
}

TEST_CASE("A program that is killed by a signal") {
    auto result = pipekit::pipeline::exec("sh -c 'kill -TERM $$'").string();
    CHECK(result.exit_status() == 128 + SIGTERM);
}

TEST_CASE("Run a command for each line") {
    pipekit::string_writer diag;
    pipekit::pipeline      p = pipekit::pipeline::echo("one\ntwo words\n");
    p.with_stderr(diag);
    p.pipe(stages::exec_for_each("echo [{{.}}] {{ . }}"));
    auto result = p.string();
    CHECK(result.ok());
    CHECK(result.value == "[one] one\n[two words] two words\n");
    CHECK(diag.str() == "");
}

TEST_CASE("Failed commands do not stop the other lines") {
    pipekit::string_writer diag;
    pipekit::pipeline      p = pipekit::pipeline::echo("0\n3\n0\n");
    p.with_stderr(diag);
    p.pipe(stages::exec_for_each("sh -c 'echo ran; exit {{.}}'"));
    auto result = p.string();
    CHECK(result.ok());
    CHECK(result.value == "ran\nran\nran\n");
    CHECK(diag.str() == "Child process failed with exit status 3\n");
}

TEST_CASE("Commands that cannot be started do not stop the other lines") {
    pipekit::string_writer diag;
    pipekit::pipeline      p = pipekit::pipeline::echo("pipekit-no-such-program\necho\n");
    p.with_stderr(diag);
    p.pipe(stages::exec_for_each("{{.}} hello"));
    auto result = p.string();
    CHECK(result.ok());
    CHECK(result.value == "hello\n");
    CHECK(diag.str().find("pipekit-no-such-program") != std::string::npos);
}

TEST_CASE("A malformed command template fails the stage") {
    auto p = pipekit::pipeline::echo("x\n");
    p.pipe(stages::exec_for_each("echo {{.Name}}"));
    p.wait();
    REQUIRE(p.error());
    CHECK(p.error()->message().find("Unsupported action [.Name]") != std::string::npos);

    auto unterminated
        = pipekit::pipeline::echo("x\n").pipe(stages::exec_for_each("echo {{.")).string();
    CHECK_FALSE(unterminated.ok());
    CHECK_THROWS_AS(unterminated.throw_if_error(), std::invalid_argument);
}

TEST_CASE("A command line that cannot be split") {
    pipekit::string_writer diag;
    pipekit::pipeline      p;
    p.with_stderr(diag);
    p.pipe(stages::exec("echo 'unbalanced"));
    p.wait();
    CHECK(p.exit_status() == 1);
    CHECK(diag.str().find("Unterminated single quote") != std::string::npos);
}
