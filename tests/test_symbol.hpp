#pragma once

#define _STRINGIZE1(x) #x
#define _STRINGIZE2(x) _STRINGIZE1(x)

//NOTE: managed token issued by the treasury
#define MANAGED_SYM_NAME "USDB"
#define MANAGED_SYM_PRECISION 4
#define MANAGED_SYM_STR ( _STRINGIZE2(MANAGED_SYM_PRECISION) "," MANAGED_SYM_NAME )

#define RESERVE_SYM_NAME "RSV"
#define RESERVE_SYM_PRECISION 4
#define RESERVE_SYM_STR ( _STRINGIZE2(RESERVE_SYM_PRECISION) "," RESERVE_SYM_NAME )
