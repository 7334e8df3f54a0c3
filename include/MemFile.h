#ifndef MEMFILE_H
#define MEMFILE_H

enum class Compress { None, Gzip, Bzip2, Xz };
std::string to_string (const Compress &compress);


class MemFile
{
public:
	bool open (const std::string &path, bool uncompress = true);
	bool open (const void *buf, int size, const std::string &path,
		const std::string &filename="");

	const Data &data () const;
	const std::string &name () const;
	Compress compression () const;

private:
	std::string m_path {};
	std::string m_filename {};
	Data m_data {};
	Compress m_compress = Compress::None;
};

#endif // MEMFILE_H
