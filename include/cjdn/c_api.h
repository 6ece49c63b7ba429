#pragma once

#include<stddef.h>

#if defined(_WIN32)
#if defined(CJDN_BUILD_DLL)
#define CJDN_API __declspec(dllexport)
#elif defined(CJDN_USE_DLL)
#define CJDN_API __declspec(dllimport)
#else
#define CJDN_API
#endif
#define CJDN_CALL __cdecl
#else
#define CJDN_API
#define CJDN_CALL
#endif

#ifdef __cplusplus
extern "C"{
#endif

/* Calendar codes. */
#define CJDN_JULIAN 1
#define CJDN_MILANKOVIC 2
#define CJDN_GREGORIAN 3

/* Status codes returned by every int function below. */
#define CJDN_OK 0
#define CJDN_ERR_FAIL 1
#define CJDN_ERR_ARG 2

CJDN_API const char*CJDN_CALL cjdn_tool_ver(void);
/* NULL when the last call on this thread succeeded. */
CJDN_API const char*CJDN_CALL cjdn_last_error(void);
CJDN_API void CJDN_CALL cjdn_clear_error(void);

CJDN_API int CJDN_CALL cjdn_run(int argc,const char*const*argv);

CJDN_API int CJDN_CALL cjdn_cmd_to(int argc,const char*const*argv);
CJDN_API int CJDN_CALL cjdn_cmd_from(int argc,const char*const*argv);
CJDN_API int CJDN_CALL cjdn_cmd_conv(int argc,const char*const*argv);
CJDN_API int CJDN_CALL cjdn_cmd_dow(int argc,const char*const*argv);
CJDN_API int CJDN_CALL cjdn_cmd_test(int argc,const char*const*argv);
CJDN_API int CJDN_CALL cjdn_cmd_cfg(int argc,const char*const*argv);
CJDN_API int CJDN_CALL cjdn_cmd_comp(int argc,const char*const*argv);

CJDN_API int CJDN_CALL cjdn_from_date(int kind,long long year,int month,
									  int day,long long*out);
/* Date text "[-]YYYY-MM-DD". */
CJDN_API int CJDN_CALL cjdn_from_text(int kind,const char*date,
									  long long*out);
CJDN_API int CJDN_CALL cjdn_to_date(int kind,long long cjdn,long long*year,
									int*month,int*day);
/* Writes the ISO date and a terminating NUL. Fails if buf is too small. */
CJDN_API int CJDN_CALL cjdn_fmt_date(int kind,long long cjdn,char*buf,
									 size_t size);
/* ISO weekday, 1 = Monday .. 7 = Sunday. */
CJDN_API int CJDN_CALL cjdn_weekday(long long cjdn,int kind,int*out);

#ifdef __cplusplus
}
#endif
