
#include <stdlib.h> // strtoull

[[noreturn]] extern void exit(int code);

#include "fs/path.hpp"
#include "shl/file_stream.hpp"
#include "shl/memory.hpp"
#include "shl/memory_stream.hpp"
#include "shl/string.hpp"
#include "shl/format.hpp"
#include "shl/io.hpp"
#include "shl/compare.hpp"
#include "shl/print.hpp"
#include "shl/error.hpp"
#include "shl/defer.hpp"
#include "book/bookfile.hpp"
#include "book/book_writer.hpp"
#include "book/book_reader.hpp"

#include "booker_info.hpp"
#include "chapter_file.hpp"


#define stream_format(StreamPtr, ...) tprint((StreamPtr)->handle, __VA_ARGS__)

struct arguments
{
    bool verbose;           // -v
    bool force;             // -f
    bool extract;           // -x
    bool list;              // -l
    u32 user_magic;         // -m
    u64 first_id;           // -i
    fs::path out_path;      // -o
    array<const_string> input_files; // anything thats not an arg
};

static const arguments default_arguments
{
    .verbose = false,
    .force = false,
    .extract = false,
    .list = false,
    .user_magic = 0,
    .first_id = 1
};

static void init(arguments *args)
{
    assert(args != nullptr);
    fs::init(&args->out_path);
    init(&args->input_files);
}

static void free(arguments *args)
{
    assert(args != nullptr);
    fs::free(&args->out_path);
    free(&args->input_files);
}

static bool _add_path_files(fs::const_fs_string path, array<fs::path> *out_paths, arguments *args, error *err)
{
    if (!fs::exists(path))
    {
        format_error(err, 1, "can't add path because path does not exist: %s", path.c_str);
        return false;
    }

    if (fs::is_file(path))
    {
        if (args->verbose)
            tprint(" adding file '%s'\n", path.c_str);

        fs::path *p = ::add_at_end(out_paths);
        fill_memory(p, 0);
        fs::set_path(p, path);
        return true;
    }
    else if (fs::is_directory(path))
    {
        for_path(it, path, fs::iterate_option::Fullpaths)
        {
            if (!_add_path_files(it->path, out_paths, args, err))
                return false;
        }
    }
    else
    {
        format_error(err, 2, "cannot add unknown path %s", path.c_str);
        return false;
    }

    return true;
}

static char _getchar(error *err)
{
    char ret = 0;

    if (io_read(stdin_handle(), &ret, 1, err) != 1)
        return (char)-1;

    return ret;
}

static char _choice_prompt(const char *message, const char *choices, arguments *args, error *err)
{
    if (args->force)
        return *choices;

    char c;
    char input;

    do
    {
        put("\n");
        put(message);

        do
        {
            input = _getchar(err);
        }
        while (is_space(input) && input != (char)-1);

        if (input == (char)-1)
            return 'x';

        c = to_lower(input);
    }
    while (index_of(choices, c) == -1);

    return c;
}

static bool _write_chapter_file(book_writer *writer, u64 id, const fs::path *path, arguments *args, error *err)
{
    memory_stream mem{};
    defer { free(&mem); };

    if (!read_entire_file(path->c_str(), &mem, err))
        return false;

    if (args->verbose)
        tprint("  chapter %u: %08x bytes %s\n", id, mem.size, path->c_str());

    book_chapter_writer chapter{};
    defer { free(&chapter, err); };

    if (!book_writer_new_chapter(writer, id, &chapter, err))
        return false;

    if (!book_chapter_write(&chapter, mem.data, mem.size, err))
        return false;

    return book_chapter_close(&chapter, err);
}

static bool _create_book(arguments *args, error *err)
{
    if (args->out_path.size == 0)
    {
        set_error(err, 1, "no output file specified");
        return false;
    }

    fs::path outp{};
    fs::weakly_canonical_path(args->out_path, &outp);
    defer { fs::free(&outp); };

    if (fs::exists(&outp))
    {
        if (!fs::is_file(&outp))
        {
            format_error(err, 2, "output file exists but is not a file: %s", outp.c_str());
            return false;
        }

        auto msg = tformat("output file %s already exists. overwrite? [y / n]: ", outp.c_str());
        char choice = _choice_prompt(msg.c_str, "yn", args, err);

        if (choice != 'y')
        {
            put("aborting");
            exit(0);
        }
    }

    array<fs::path> paths{};
    defer { free<true>(&paths); };

    fs::path epath{};
    defer { fs::free(&epath); };

    for_array(input_path, &args->input_files)
    {
        if (!fs::weakly_canonical_path(to_const_string(*input_path), &epath, err))
            return false;

        if (!_add_path_files(to_const_string(epath), &paths, args, err))
            return false;
    }

    book_writer writer{};
    defer { free(&writer); };

    if (!book_writer_open_path(&writer, outp.c_str(), args->user_magic, err))
        return false;

    if (args->verbose)
        tprint("\nwriting book %s, user magic %08x\n", outp.c_str(), args->user_magic);

    u64 id = args->first_id;

    for_array(pth, &paths)
    {
        if (!_write_chapter_file(&writer, id, pth, args, err))
            return false;

        id++;
    }

    return book_writer_finish(&writer, err);
}

static bool _extract_book(arguments *args, book_reader *reader, error *err)
{
    fs::path outp{};
    fs::set_path(&outp, args->out_path);
    defer { fs::free(&outp); };

    fs::path epath{};
    defer { fs::free(&epath); };

    bool always_overwrite = false;
    bool never_overwrite = false;
    char name[64] = {0};

    if (!fs::exists(&outp) && !fs::create_directories(&outp, fs::permission::User, err))
        return false;

    s64 count = book_reader_chapter_count(reader);

    for (s64 i = 0; i < count; ++i)
    {
        book_chapter_index index{};
        book_toc_entry entry{};

        if (!book_reader_chapter_at(reader, i, &index, err))
            return false;

        if (!book_reader_get_entry(reader, index, &entry, err))
            return false;

        if (booker_chapter_file_name(i, entry.id, name, sizeof(name)) < 0)
        {
            format_error(err, 1, "could not name chapter %x with id %x", i, entry.id);
            return false;
        }

        fs::set_path(&epath, outp);
        fs::append_path(&epath, name);

        if (fs::exists(&epath))
        {
            if (never_overwrite)
            {
                tprint("skipping existing file %s\n", epath.c_str());
                continue;
            }

            if (!fs::is_file(&epath))
            {
                format_error(err, 1, "chapter output path exists but is not a file: %s", epath.c_str());
                return false;
            }

            if (!always_overwrite)
            {
                auto msg = tformat("output file %s already exists. overwrite? [y / n / (a)lways overwrite / n(e)ver overwrite]: ", epath.c_str());
                char choice = _choice_prompt(msg.c_str, "ynae", args, err);

                if (choice == 'n')
                {
                    put("skipping");
                    continue;
                }
                else if (choice == 'a')
                {
                    put("always overwriting");
                    always_overwrite = true;
                }
                else if (choice == 'e')
                {
                    put("never overwriting");
                    tprint("skipping existing file %s\n", epath.c_str());
                    never_overwrite = true;
                    continue;
                }
            }
        }

        memory_stream mem{};
        defer { free(&mem); };

        if (!book_reader_read_chapter(reader, index, &mem, err))
            return false;

        if (args->verbose)
            tprint("  %08x bytes %s\n", mem.size, epath.c_str());

        io_handle h = io_open(epath.c_str(), open_mode::WriteTrunc, err);

        if (h == INVALID_IO_HANDLE)
            return false;

        defer { io_close(h); };

        if (mem.size > 0 && io_write(h, mem.data, mem.size, err) == -1)
            return false;
    }

    return true;
}

static bool _extract_books(arguments *args, error *err)
{
    if (args->out_path.size == 0)
    {
        set_error(err, 1, "no output directory specified");
        return false;
    }

    fs::path p{};
    defer { fs::free(&p); };

    for_array(path, &args->input_files)
    {
        fs::set_path(&p, path->c_str);

        if (!fs::is_file(&p))
        {
            format_error(err, 1, "not a file: '%s'", path->c_str);
            return false;
        }

        if (args->verbose)
            tprint("extracting book %s\n", path->c_str);

        book_reader reader{};
        defer { free(&reader); };

        if (!book_reader_open_path(&reader, path->c_str, err))
            return false;

        if (!_extract_book(args, &reader, err))
            return false;
    }

    return true;
}

template<typename T>
constexpr inline T dec_digits(T x)
{
    T i = 0;

    while (x > 0)
    {
        x = x / 10;
        ++i;
    }

    return i;
}

static bool _list_book_contents(arguments *args, error *err)
{
    file_stream out{};
    out.handle = stdout_handle();

    if (args->out_path.size > 0)
    {
        if (!init(&out, args->out_path.c_str(), open_mode::Write, err))
            return false;
    }

    defer { if (args->out_path.size > 0) free(&out); };

    for_array(input, &args->input_files)
    {
        stream_format(&out, "contents of book %s:\n", input->c_str);

        book_reader reader{};
        defer { free(&reader); };

        if (!book_reader_open_path(&reader, input->c_str, err))
            return false;

        s64 count = book_reader_chapter_count(&reader);

        stream_format(&out, "user magic %08x, %d chapters found\n", book_reader_user_magic(&reader), count);

        s64 digits = dec_digits(count);

        if (digits == 0)
            digits = 1;

        char digit_fmt[16] = {0};
        format(digit_fmt, 15, "  \%0%ldd ", digits);

        if (args->verbose)
            stream_format(&out, "\n  %.*s offset           size             id\n", digits, "n               ");
        else
            stream_format(&out, "\n  %.*s size             id\n", digits, "n               ");

        for (s64 i = 0; i < count; ++i)
        {
            book_chapter_index index{};
            book_toc_entry entry{};

            if (!book_reader_chapter_at(&reader, i, &index, err))
                return false;

            if (!book_reader_get_entry(&reader, index, &entry, err))
                return false;

            stream_format(&out, digit_fmt, i);

            if (args->verbose)
                stream_format(&out, "%016x ", entry.has_span ? entry.span.offset : 0);

            stream_format(&out, "%016x %u\n", entry.has_span ? entry.span.length : 0, entry.id);
        }
    }

    return true;
}

static void _show_help_and_exit()
{
    put(booker_NAME R"( [-h] [-v] [-f] [-x | -l] [-m <magic>] [-i <id>] -o <path> <files...>
  v)"   booker_VERSION R"(

Writes, extracts or lists the chapters of book files.

ARGUMENTS:
  -h            Show this help and exit.
  -v            Show verbose output.
  -f            Force overwrite any files without prompting.
  -x            Extract the chapters of the input books into the output directory.
  -l            List the chapters of the input books.
  -m <magic>    The user magic number stored in a new book. Defaults to 0.
  -i <id>       The id of the first chapter of a new book, following chapters
                count up from it. Defaults to 1.
  -o <path>     The output file / path.

  <files>       The input files. When writing a book, each file becomes one
                chapter, directories are added recursively.
)");

    exit(0);
}

#define _next_arg(Var, Argc, Argv, I)\
    {\
        if ((I) >= (Argc) - 1)\
        {\
            format_error(err, 1, "argument '%s' missing parameter", (Argv)[(I)]);\
            return false;\
        }\
    \
        I += 1;\
        Var = (Argv)[(I)];\
    }

static bool _parse_number(const char *str, u64 max, u64 *out, error *err)
{
    char *end = nullptr;
    unsigned long long val = strtoull(str, &end, 0);

    if (end == str || *end != '\0' || val > max)
    {
        format_error(err, 1, "invalid number '%s'", str);
        return false;
    }

    *out = (u64)val;
    return true;
}

static bool _parse_arguments(int argc, char **argv, arguments *args, error *err)
{
    for (int i = 1; i < argc; ++i)
    {
        const_string arg = to_const_string(argv[i]);

        if (arg == "-h"_cs)
        {
            _show_help_and_exit();
            continue;
        }

        if (arg == "-v"_cs)
        {
            args->verbose = true;
            continue;
        }

        if (arg == "-f"_cs)
        {
            args->force = true;
            continue;
        }

        if (arg == "-x"_cs)
        {
            args->extract = true;
            continue;
        }

        if (arg == "-l"_cs)
        {
            args->list = true;
            continue;
        }

        if (arg == "-o"_cs)
        {
            const char *narg;
            _next_arg(narg, argc, argv, i);
            fs::set_path(&args->out_path, narg);
            continue;
        }

        if (arg == "-m"_cs)
        {
            const char *narg;
            _next_arg(narg, argc, argv, i);
            u64 magic = 0;

            if (!_parse_number(narg, 0xFFFFFFFFu, &magic, err))
                return false;

            args->user_magic = (u32)magic;
            continue;
        }

        if (arg == "-i"_cs)
        {
            const char *narg;
            _next_arg(narg, argc, argv, i);

            if (!_parse_number(narg, (u64)-1, &args->first_id, err))
                return false;

            continue;
        }

        if (compare_strings(arg, "-"_cs, 1) == 0)
        {
            format_error(err, 1, "unexpected argument '%s'", arg);
            return false;
        }

        add_at_end(&args->input_files, arg);
    }

    return true;
}

static bool _main(int argc, char **argv, error *err)
{
    arguments args = default_arguments;
    init(&args);
    defer { free(&args); };

    if (!_parse_arguments(argc, argv, &args, err))
        return false;

    if (args.input_files.size == 0)
    {
        set_error(err, 1, "no input files");
        return false;
    }

    if (args.list && args.extract)
    {
        set_error(err, 2, "can only do one of extract (-x) or list (-l)");
        return false;
    }

    bool ret = false;

    if (args.list)
        return _list_book_contents(&args, err);
    else if (args.extract)
        ret = _extract_books(&args, err);
    else
        ret = _create_book(&args, err);

    if (!ret)
        return false;

    put("done");
    return true;
}

int main(int argc, char **argv)
{
    error err{};

    if (!_main(argc, argv, &err))
    {
#ifndef NDEBUG
        tprint("[%:%] error %: %\n", err.file, (s64)err.line, err.error_code, err.what);
#else
        tprint("error %: %\n", err.error_code, err.what);
#endif
        return 1;
    }

    return 0;
}
