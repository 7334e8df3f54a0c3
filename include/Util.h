#ifndef UTIL_H
#define UTIL_H

const int SECTOR_SIZE = 512;

class Data : public std::vector<uint8_t>
{
public:
	using std::vector<uint8_t>::vector;
	int size() const { return static_cast<int>(std::vector<uint8_t>::size()); }
};


#ifndef arraysize
template <typename T, size_t N>
char (&ArraySizeHelper(T (&array)[N]))[N];
#define arraysize(array) (sizeof(ArraySizeHelper(array)))
#endif


enum MsgType { msgStatus, msgInfo, msgFix, msgWarning, msgError };


template <typename ...Args>
void Message (MsgType type, const char* pcsz_, Args&& ...args)
{
	std::string msg = util::fmt(pcsz_, std::forward<Args>(args)...);

	if (type == msgError)
		throw util::exception(msg);

	switch (type)
	{
		case msgStatus:	 break;
		case msgInfo:	 util::cout << "Info: "; break;
		case msgFix:	 util::cout << colour::GREEN << "Fixed: "; break;
		case msgWarning: util::cout << colour::YELLOW << "Warning: "; break;
		case msgError:	 util::cout << colour::RED << "Error: "; break;
	}

	if (type == msgStatus)
		util::cout << ttycmd::statusbegin << "\r" << msg << ttycmd::statusend;
	else
		util::cout << msg << colour::none << '\n';
}

bool IsFile (const std::string &path);
bool IsDir (const std::string &path);
bool IsVolumePath (const std::string &path, int *pVolume = nullptr);
std::string VolumeImagePath (const std::string &path);

std::string FileExt (const std::string &path);
bool IsFileExt (const std::string &path, const std::string &ext);
int64_t FileSize (const std::string &path);
bool IsSamePath (const std::string &path1, const std::string &path2);

std::string AbbreviateSize (int64_t total_bytes);

#ifndef S_ISDIR
#define _S_ISTYPE(mode,mask)    (((mode) & _S_IFMT) == (mask))
#define S_ISDIR(mode)           _S_ISTYPE((mode), _S_IFDIR)
#define S_ISREG(mode)           _S_ISTYPE((mode), _S_IFREG)
#endif

#endif
