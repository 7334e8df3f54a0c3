// Memory-backed files used for disk images

#include "V9Kdisk.h"
#include "MemFile.h"

#ifdef HAVE_ZLIB
#include <zlib.h>
#endif

#ifdef HAVE_BZIP2
#define BZ_NO_STDIO
#include <bzlib.h>
#endif

#ifdef HAVE_LZMA
#include <lzma.h>
#endif

std::string to_string (const Compress &compression)
{
	switch (compression)
	{
		default:
		case Compress::None:	return "none";
		case Compress::Gzip:	return "gzip";
		case Compress::Bzip2:	return "bzip2";
		case Compress::Xz:		return "xz";
	}
}


bool MemFile::open (const std::string &path_, bool uncompress)
{
	std::string filename;

	if (IsDir(path_))
		throw util::exception("path is a directory");

	FILE *f = fopen(path_.c_str(), "rb");
	if (!f)
		throw posix_error(errno, path_.c_str());

	// Read the raw file contents, allowing one byte beyond the limit to detect oversized files
	Data mem(MAX_IMAGE_SIZE + 1);
	auto uRead = fread(mem.data(), 1, mem.size(), f);
	auto read_error = ferror(f);
	fclose(f);

	if (read_error)
		throw posix_error(EIO, path_.c_str());

	mem.resize(uRead);
	m_compress = Compress::None;

	// gzip compressed?
	if (uncompress && uRead >= 2 && mem[0U] == 0x1f && mem[1U] == 0x8b)
	{
#ifndef HAVE_ZLIB
		throw util::exception("zlib support is not available for gzipped files");
#else
		Data mem2(MAX_IMAGE_SIZE + 1);

		z_stream stream{};
		stream.next_in = mem.data();
		stream.avail_in = static_cast<uInt>(uRead);
		stream.next_out = mem2.data();
		stream.avail_out = static_cast<uInt>(mem2.size());

		auto zerr = inflateInit2(&stream, 16 + MAX_WBITS); // 16=gzip
		if (zerr == Z_OK)
		{
			Bytef name[MAX_PATH]{};
			gz_header header{};
			header.name = name;
			header.name_max = MAX_PATH;

			zerr = inflateGetHeader(&stream, &header);
			if (zerr == Z_OK)
				zerr = inflate(&stream, Z_FINISH);
			if (zerr == Z_STREAM_END && name[0])
				filename = reinterpret_cast<const char*>(name);
			inflateEnd(&stream);
		}

		if (zerr != Z_STREAM_END)
			throw util::exception("gzip decompression failed (", zerr, ")");

		mem2.resize(uRead = stream.total_out);
		mem.swap(mem2);
		m_compress = Compress::Gzip;
#endif // HAVE_ZLIB
	}

	// bzip2 compressed?
	if (uncompress && uRead >= 2 && mem[0U] == 'B' && mem[1U] == 'Z')
	{
#ifndef HAVE_BZIP2
		throw util::exception("bzip2 support is not available");
#else
		Data mem2(MAX_IMAGE_SIZE + 1);

		auto uBzRead = static_cast<unsigned>(mem2.size());
		auto bzerr = BZ2_bzBuffToBuffDecompress(
			reinterpret_cast<char *>(mem2.data()), &uBzRead,
			reinterpret_cast<char *>(mem.data()), static_cast<unsigned>(uRead), 0, 0);
		if (bzerr != BZ_OK)
			throw util::exception("bzip2 decompression failed (", bzerr, ")");

		mem2.resize(uRead = uBzRead);
		mem.swap(mem2);
		m_compress = Compress::Bzip2;
#endif // HAVE_BZIP2
	}

	// xz compressed?
	if (uncompress && uRead > 6 && !memcmp(mem.data(), "\xfd\x37\x7a\x58\x5a\x00", 6))
	{
#ifndef HAVE_LZMA
		throw util::exception("lzma support is not available");
#else
		Data mem2(MAX_IMAGE_SIZE + 1);

		lzma_stream strm = LZMA_STREAM_INIT;
		const uint32_t flags = LZMA_TELL_UNSUPPORTED_CHECK;
		auto ret = lzma_stream_decoder (&strm, UINT64_MAX, flags);
		if (ret == LZMA_OK)
		{
			strm.next_in = mem.data();
			strm.avail_in = uRead;
			strm.next_out = mem2.data();
			strm.avail_out = mem2.size();

			ret = lzma_code(&strm, LZMA_FINISH);
			if (ret == LZMA_STREAM_END)
			{
				mem2.resize(uRead = mem2.size() - strm.avail_out);
				mem.swap(mem2);
				m_compress = Compress::Xz;
				ret = LZMA_OK;
			}
		}
		lzma_end(&strm);

		if (ret != LZMA_OK)
			throw util::exception("xz decompression failed (", ret, ")");
#endif // HAVE_LZMA
	}

	if (uRead <= static_cast<size_t>(MAX_IMAGE_SIZE))
		return open(mem.data(), static_cast<int>(uRead), path_, filename);

	throw util::exception("file size too big");
}

bool MemFile::open (const void *buf, int len, const std::string &path_, const std::string &filename_)
{
	auto pb = reinterpret_cast<const uint8_t *>(buf);

	m_data.assign(pb, pb + len);
	m_path = path_;
	m_filename = filename_;

	// If a filename wasn't supplied from an archive, determine it here.
	if (filename_.empty())
	{
		std::string::size_type pos = m_path.rfind(PATH_SEPARATOR_CHR);
		m_filename = (pos == m_path.npos) ? m_path : m_path.substr(pos + 1);

		// Remove the archive extension from single compressed files.
		if (IsFileExt(m_filename, "gz") || IsFileExt(m_filename, "xz"))
			m_filename = m_filename.substr(0, m_filename.size() - 3);
		else if (IsFileExt(m_filename, "bz2"))
			m_filename = m_filename.substr(0, m_filename.size() - 4);
	}

	return true;
}


const Data &MemFile::data () const
{
	return m_data;
}

const std::string &MemFile::name () const
{
	return m_filename;
}

Compress MemFile::compression () const
{
	return m_compress;
}
